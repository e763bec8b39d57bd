#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sigil::command {

struct ActorRef {
    std::string id;
    std::string name;
    bool online = false;

    bool operator==(const ActorRef& other) const { return id == other.id; }
};

struct WorldRef {
    std::string name;

    bool operator==(const WorldRef& other) const { return name == other.name; }
};

// Read-only view of the host's entity and world model.
class IHostDirectory {
public:
    virtual ~IHostDirectory() = default;

    virtual std::vector<ActorRef> online_actors() const = 0;
    virtual std::vector<WorldRef> worlds() const = 0;

    // Any actor the host has ever seen, matched by id or name
    virtual std::optional<ActorRef> find_known_actor(
        const std::string& name_or_id) const = 0;

    // Exact name match first, then case-insensitive
    virtual std::optional<ActorRef> find_online_actor(
        const std::string& name) const;
    virtual std::optional<WorldRef> find_world(const std::string& name) const;
};

}  // namespace sigil::command

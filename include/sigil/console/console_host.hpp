#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include "sigil/command/host.hpp"
#include "sigil/command/host_binder.hpp"
#include "sigil/command/sender.hpp"

namespace sigil::console {

// Sender that writes replies to a stream. The console kind holds every
// permission; a player holds only what it was granted ("*" grants all).
class StreamSender : public command::ICommandSender {
public:
    StreamSender(std::string name, command::SenderKind kind, std::ostream& out)
        : name_(std::move(name)), kind_(kind), out_(out) {}

    std::string name() const override { return name_; }
    std::string id() const override { return "console:" + name_; }
    command::SenderKind kind() const override { return kind_; }
    bool has_permission(const std::string& permission) const override;
    void send_message(const std::string& message) override;

    void grant(const std::string& permission) { permissions_.insert(permission); }
    void revoke(const std::string& permission) { permissions_.erase(permission); }

private:
    std::string name_;
    command::SenderKind kind_;
    std::ostream& out_;
    std::set<std::string> permissions_;
};

// Actors and worlds held in memory, standing in for a live host.
class MemoryDirectory : public command::IHostDirectory {
public:
    MemoryDirectory() = default;

    std::vector<command::ActorRef> online_actors() const override;
    std::vector<command::WorldRef> worlds() const override;
    std::optional<command::ActorRef> find_known_actor(
        const std::string& name_or_id) const override;

    // Adds or updates an actor; the id is derived from the name
    command::ActorRef add_actor(const std::string& name, bool online = true);
    bool set_online(const std::string& name, bool online);
    void add_world(const std::string& name);

private:
    mutable std::mutex mutex_;
    std::map<std::string, command::ActorRef> actors_;
    std::vector<command::WorldRef> worlds_;
};

// Records the console's command table; the console has nothing else to wire.
class ConsoleBinder : public command::IHostBinder {
public:
    void bind(const command::RootNodePtr& root) override;
    void unbind(const command::RootNodePtr& root) override;

    std::set<std::string> labels() const;

private:
    mutable std::mutex mutex_;
    std::set<std::string> labels_;
};

}  // namespace sigil::console

#include "sigil/command/host.hpp"

#include <boost/algorithm/string/predicate.hpp>

namespace sigil::command {

std::optional<ActorRef> IHostDirectory::find_online_actor(
    const std::string& name) const {
    auto actors = online_actors();
    for (const auto& actor : actors) {
        if (actor.name == name) {
            return actor;
        }
    }
    for (const auto& actor : actors) {
        if (boost::algorithm::iequals(actor.name, name)) {
            return actor;
        }
    }
    return std::nullopt;
}

std::optional<WorldRef> IHostDirectory::find_world(
    const std::string& name) const {
    auto all = worlds();
    for (const auto& world : all) {
        if (world.name == name) {
            return world;
        }
    }
    for (const auto& world : all) {
        if (boost::algorithm::iequals(world.name, name)) {
            return world;
        }
    }
    return std::nullopt;
}

}  // namespace sigil::command

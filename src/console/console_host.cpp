#include "sigil/console/console_host.hpp"

#include "sigil/command/text.hpp"
#include "sigil/log/logger.hpp"

namespace sigil::console {

bool StreamSender::has_permission(const std::string& permission) const {
    if (kind_ == command::SenderKind::CONSOLE) {
        return true;
    }
    return permissions_.count("*") > 0 || permissions_.count(permission) > 0;
}

void StreamSender::send_message(const std::string& message) {
    out_ << message << std::endl;
}

std::vector<command::ActorRef> MemoryDirectory::online_actors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<command::ActorRef> online;
    for (const auto& [id, actor] : actors_) {
        if (actor.online) {
            online.push_back(actor);
        }
    }
    return online;
}

std::vector<command::WorldRef> MemoryDirectory::worlds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worlds_;
}

std::optional<command::ActorRef> MemoryDirectory::find_known_actor(
    const std::string& name_or_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = actors_.find(name_or_id); it != actors_.end()) {
        return it->second;
    }
    for (const auto& [id, actor] : actors_) {
        if (command::text::to_lower(actor.name) ==
            command::text::to_lower(name_or_id)) {
            return actor;
        }
    }
    return std::nullopt;
}

command::ActorRef MemoryDirectory::add_actor(const std::string& name,
                                             bool online) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = "actor-" + command::text::to_lower(name);
    auto& actor = actors_[id];
    actor = command::ActorRef{id, name, online};
    return actor;
}

bool MemoryDirectory::set_online(const std::string& name, bool online) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = actors_.find("actor-" + command::text::to_lower(name));
    if (it == actors_.end()) {
        return false;
    }
    it->second.online = online;
    return true;
}

void MemoryDirectory::add_world(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    worlds_.push_back(command::WorldRef{name});
}

void ConsoleBinder::bind(const command::RootNodePtr& root) {
    std::lock_guard<std::mutex> lock(mutex_);
    labels_.insert(root->name());
    labels_.insert(root->aliases().begin(), root->aliases().end());
    SIGIL_LOG_DEBUG << "Bound /" << root->name();
}

void ConsoleBinder::unbind(const command::RootNodePtr& root) {
    std::lock_guard<std::mutex> lock(mutex_);
    labels_.erase(root->name());
    for (const auto& alias : root->aliases()) {
        labels_.erase(alias);
    }
    SIGIL_LOG_DEBUG << "Unbound /" << root->name();
}

std::set<std::string> ConsoleBinder::labels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return labels_;
}

}  // namespace sigil::console

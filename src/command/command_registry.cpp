#include "sigil/command/command_registry.hpp"

#include "sigil/command/errors.hpp"
#include "sigil/log/logger.hpp"

namespace sigil::command {

CommandRegistration CommandRegistry::describe(const RootNode& root) {
    return CommandRegistration{root.owner(), root.name(), root.aliases()};
}

void CommandRegistry::set_binder(std::shared_ptr<IHostBinder> binder) {
    std::lock_guard<std::mutex> lock(binder_mutex_);
    binder_ = std::move(binder);
}

CommandRegistration CommandRegistry::register_root(const RootNodePtr& root) {
    if (!root) {
        throw CommandException("Cannot register a null command");
    }
    auto previous = graph_.register_root(root);

    std::lock_guard<std::mutex> lock(binder_mutex_);
    if (binder_) {
        if (previous) {
            binder_->unbind(previous);
        }
        binder_->bind(root);
        binder_->sync();
    }
    SIGIL_LOG_INFO << "Registered /" << root->name() << " for " << root->owner()
                   << " with " << root->aliases().size() << " aliases";
    return describe(*root);
}

bool CommandRegistry::unregister(const std::string& name) {
    auto removed = graph_.unregister(name);
    if (!removed) {
        return false;
    }
    unbind_all({removed});
    SIGIL_LOG_INFO << "Unregistered /" << removed->name();
    return true;
}

size_t CommandRegistry::unregister_all(const std::string& owner) {
    auto removed = graph_.unregister_all(owner);
    unbind_all(removed);
    if (!removed.empty()) {
        SIGIL_LOG_INFO << "Unregistered " << removed.size() << " commands of "
                       << owner;
    }
    return removed.size();
}

size_t CommandRegistry::unregister_all() {
    auto removed = graph_.roots();
    graph_.clear();
    unbind_all(removed);
    return removed.size();
}

std::vector<CommandRegistration> CommandRegistry::registrations() const {
    std::vector<CommandRegistration> result;
    for (const auto& root : graph_.roots()) {
        result.push_back(describe(*root));
    }
    return result;
}

std::vector<CommandRegistration> CommandRegistry::registrations(
    const std::string& owner) const {
    std::vector<CommandRegistration> result;
    for (const auto& root : graph_.roots_by_owner(owner)) {
        result.push_back(describe(*root));
    }
    return result;
}

void CommandRegistry::unbind_all(const std::vector<RootNodePtr>& removed) {
    std::lock_guard<std::mutex> lock(binder_mutex_);
    if (!binder_ || removed.empty()) {
        return;
    }
    for (const auto& root : removed) {
        binder_->unbind(root);
    }
    binder_->sync();
}

}  // namespace sigil::command

#pragma once

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "sigil/command/command_graph.hpp"
#include "sigil/command/host_binder.hpp"

namespace sigil::command {

struct CommandRegistration {
    std::string owner;
    std::string name;
    std::set<std::string> aliases;
};

/**
 * @brief Graph front end that keeps the host's command table in step.
 *
 * Every root added to or removed from the graph is passed to the binder, if
 * one is attached. Binder failures propagate after the graph has changed.
 */
class CommandRegistry {
public:
    explicit CommandRegistry(CommandGraph& graph,
                             std::shared_ptr<IHostBinder> binder = nullptr)
        : graph_(graph), binder_(std::move(binder)) {}

    CommandRegistration register_root(const RootNodePtr& root);
    bool unregister(const std::string& name);
    // Roots registered by owner; returns how many were removed
    size_t unregister_all(const std::string& owner);
    size_t unregister_all();

    std::vector<CommandRegistration> registrations() const;
    std::vector<CommandRegistration> registrations(const std::string& owner) const;

    void set_binder(std::shared_ptr<IHostBinder> binder);
    CommandGraph& graph() { return graph_; }
    const CommandGraph& graph() const { return graph_; }

private:
    static CommandRegistration describe(const RootNode& root);
    void unbind_all(const std::vector<RootNodePtr>& removed);

    CommandGraph& graph_;
    mutable std::mutex binder_mutex_;
    std::shared_ptr<IHostBinder> binder_;
};

}  // namespace sigil::command

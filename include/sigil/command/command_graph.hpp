#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "sigil/command/command_node.hpp"

namespace sigil::command {

struct Resolution {
    RootNodePtr root;
    // Deepest matched node; the root itself when no child matched
    std::shared_ptr<const CommandNode> node;
    // Canonical names from the root down to node
    std::vector<std::string> path;
    // Tokens after the matched prefix
    std::vector<std::string> remaining;

    bool found() const { return root != nullptr; }
    std::string path_string() const;
    // Nodes from the root to node, inclusive
    std::vector<std::shared_ptr<const CommandNode>> chain() const;
};

/**
 * @brief Registry of root commands indexed by name, alias and owner.
 *
 * Writers serialize on a single mutex and publish a fresh immutable snapshot
 * of all three indices; readers load the current snapshot without locking,
 * so they never observe a half-applied registration.
 *
 * Re-registering a name from a different owner replaces the previous root
 * (last write wins) and logs a warning.
 */
class CommandGraph {
public:
    CommandGraph();

    // Returns the root that was replaced, if any
    RootNodePtr register_root(RootNodePtr root);
    RootNodePtr unregister(const std::string& name);
    std::vector<RootNodePtr> unregister_all(const std::string& owner);
    void clear();

    RootNodePtr get_root(const std::string& name_or_alias) const;
    // Longest-prefix walk: the root from tokens[0], then children by name or
    // alias until the first miss
    Resolution resolve(const std::vector<std::string>& tokens) const;

    std::vector<RootNodePtr> roots() const;
    std::vector<RootNodePtr> roots_by_owner(const std::string& owner) const;
    std::vector<std::string> root_names() const;
    // Root names plus aliases, for completing the label itself
    std::vector<std::string> labels() const;
    bool contains(const std::string& name_or_alias) const;
    size_t size() const;

private:
    struct Snapshot {
        std::unordered_map<std::string, RootNodePtr> roots;
        std::unordered_map<std::string, std::string> aliases;
        std::unordered_map<std::string, std::set<std::string>> owners;
    };
    using SnapshotPtr = std::shared_ptr<const Snapshot>;

    SnapshotPtr snapshot() const {
        return snapshot_.load(std::memory_order_acquire);
    }
    void publish(std::shared_ptr<Snapshot> next) {
        snapshot_.store(std::move(next), std::memory_order_release);
    }
    static RootNodePtr remove_locked(Snapshot& snapshot,
                                     const std::string& name);

    std::mutex write_mutex_;
    std::atomic<SnapshotPtr> snapshot_;
};

}  // namespace sigil::command

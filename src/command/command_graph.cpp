#include "sigil/command/command_graph.hpp"

#include <algorithm>

#include "sigil/command/errors.hpp"
#include "sigil/command/text.hpp"
#include "sigil/log/logger.hpp"

namespace sigil::command {

std::string Resolution::path_string() const { return text::join(path, 0); }

std::vector<std::shared_ptr<const CommandNode>> Resolution::chain() const {
    std::vector<std::shared_ptr<const CommandNode>> nodes;
    if (!root) {
        return nodes;
    }
    std::shared_ptr<const CommandNode> current = root;
    nodes.push_back(current);
    for (size_t i = 1; i < path.size(); ++i) {
        current = current->child(path[i]);
        if (!current) {
            break;
        }
        nodes.push_back(current);
    }
    return nodes;
}

CommandGraph::CommandGraph()
    : snapshot_(SnapshotPtr(std::make_shared<Snapshot>())) {}

RootNodePtr CommandGraph::remove_locked(Snapshot& snapshot,
                                        const std::string& name) {
    auto it = snapshot.roots.find(name);
    if (it == snapshot.roots.end()) {
        return nullptr;
    }
    RootNodePtr removed = it->second;
    snapshot.roots.erase(it);

    // Only aliases still pointing at this root; another root may have taken
    // one over since
    for (const auto& alias : removed->aliases()) {
        auto alias_it = snapshot.aliases.find(alias);
        if (alias_it != snapshot.aliases.end() && alias_it->second == name) {
            snapshot.aliases.erase(alias_it);
        }
    }

    auto owner_it = snapshot.owners.find(removed->owner());
    if (owner_it != snapshot.owners.end()) {
        owner_it->second.erase(name);
        if (owner_it->second.empty()) {
            snapshot.owners.erase(owner_it);
        }
    }
    return removed;
}

RootNodePtr CommandGraph::register_root(RootNodePtr root) {
    if (!root) {
        throw CommandException("Cannot register a null root command");
    }
    const std::string& name = root->name();

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<Snapshot>(*snapshot());

    RootNodePtr previous = remove_locked(*next, name);
    if (previous && previous->owner() != root->owner()) {
        SIGIL_LOG_WARN << "Command '" << name << "' from " << root->owner()
                       << " replaces the one registered by "
                       << previous->owner();
    }

    for (const auto& alias : root->aliases()) {
        auto existing = next->aliases.find(alias);
        if (existing != next->aliases.end() && existing->second != name) {
            SIGIL_LOG_WARN << "Alias '" << alias << "' moves from command '"
                           << existing->second << "' to '" << name << "'";
        }
        if (next->roots.count(alias) > 0) {
            SIGIL_LOG_WARN << "Alias '" << alias << "' of '" << name
                           << "' is shadowed by a command of the same name";
        }
        next->aliases[alias] = name;
    }
    next->roots[name] = root;
    next->owners[root->owner()].insert(name);

    publish(std::move(next));
    SIGIL_LOG_DEBUG << "Registered command '" << name << "' for "
                    << root->owner();
    return previous;
}

RootNodePtr CommandGraph::unregister(const std::string& name) {
    const auto key = text::to_lower(name);
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = snapshot();
    if (current->roots.count(key) == 0) {
        return nullptr;
    }
    auto next = std::make_shared<Snapshot>(*current);
    RootNodePtr removed = remove_locked(*next, key);
    publish(std::move(next));
    return removed;
}

std::vector<RootNodePtr> CommandGraph::unregister_all(
    const std::string& owner) {
    std::vector<RootNodePtr> removed;
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = snapshot();
    auto owner_it = current->owners.find(owner);
    if (owner_it == current->owners.end()) {
        return removed;
    }
    auto next = std::make_shared<Snapshot>(*current);
    for (const auto& name : owner_it->second) {
        if (auto root = remove_locked(*next, name)) {
            removed.push_back(std::move(root));
        }
    }
    publish(std::move(next));
    return removed;
}

void CommandGraph::clear() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    publish(std::make_shared<Snapshot>());
}

RootNodePtr CommandGraph::get_root(const std::string& name_or_alias) const {
    const auto key = text::to_lower(name_or_alias);
    auto current = snapshot();
    if (auto it = current->roots.find(key); it != current->roots.end()) {
        return it->second;
    }
    if (auto alias = current->aliases.find(key);
        alias != current->aliases.end()) {
        if (auto it = current->roots.find(alias->second);
            it != current->roots.end()) {
            return it->second;
        }
    }
    return nullptr;
}

Resolution CommandGraph::resolve(const std::vector<std::string>& tokens) const {
    Resolution resolution;
    if (tokens.empty()) {
        return resolution;
    }
    resolution.root = get_root(tokens[0]);
    if (!resolution.root) {
        return resolution;
    }

    std::shared_ptr<const CommandNode> node = resolution.root;
    resolution.path.push_back(node->name());
    size_t index = 1;
    for (; index < tokens.size(); ++index) {
        auto child = node->child(tokens[index]);
        if (!child) {
            break;
        }
        node = child;
        resolution.path.push_back(node->name());
    }
    resolution.node = node;
    resolution.remaining.assign(tokens.begin() + index, tokens.end());
    return resolution;
}

std::vector<RootNodePtr> CommandGraph::roots() const {
    auto current = snapshot();
    std::vector<RootNodePtr> result;
    result.reserve(current->roots.size());
    for (const auto& [name, root] : current->roots) {
        result.push_back(root);
    }
    std::sort(result.begin(), result.end(),
              [](const RootNodePtr& a, const RootNodePtr& b) {
                  return a->name() < b->name();
              });
    return result;
}

std::vector<RootNodePtr> CommandGraph::roots_by_owner(
    const std::string& owner) const {
    auto current = snapshot();
    std::vector<RootNodePtr> result;
    auto owner_it = current->owners.find(owner);
    if (owner_it == current->owners.end()) {
        return result;
    }
    for (const auto& name : owner_it->second) {
        if (auto it = current->roots.find(name); it != current->roots.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::vector<std::string> CommandGraph::root_names() const {
    auto current = snapshot();
    std::vector<std::string> names;
    names.reserve(current->roots.size());
    for (const auto& [name, root] : current->roots) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> CommandGraph::labels() const {
    auto current = snapshot();
    std::vector<std::string> result;
    for (const auto& [name, root] : current->roots) {
        result.push_back(name);
    }
    for (const auto& [alias, name] : current->aliases) {
        result.push_back(alias);
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

bool CommandGraph::contains(const std::string& name_or_alias) const {
    return get_root(name_or_alias) != nullptr;
}

size_t CommandGraph::size() const { return snapshot()->roots.size(); }

}  // namespace sigil::command

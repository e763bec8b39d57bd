#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sigil/command/spec.hpp"

namespace sigil::command {

class CommandContext;

// Pre-bound invocation target produced at registration time.
class CompiledExecutor {
public:
    using Function = std::function<bool(CommandContext&)>;

    CompiledExecutor() = default;
    explicit CompiledExecutor(Function fn) : fn_(std::move(fn)) {}

    bool operator()(CommandContext& ctx) const { return fn_(ctx); }
    explicit operator bool() const { return static_cast<bool>(fn_); }

private:
    Function fn_;
};

class SubNode;
class RootNode;
using SubNodePtr = std::shared_ptr<const SubNode>;
using RootNodePtr = std::shared_ptr<const RootNode>;

struct NodeData {
    std::string name;
    std::set<std::string> aliases;
    std::string description;
    std::optional<std::string> usage;
    std::optional<std::string> permission;
    bool player_only = false;
    std::vector<ArgumentSpec> arguments;
    std::vector<FlagSpec> flags;
    std::optional<CooldownSpec> cooldown;
    std::map<std::string, SubNodePtr> children;
    CompiledExecutor executor;
};

/**
 * @brief Immutable command tree entry.
 *
 * A node may be executable, have children, or both. Names and aliases are
 * lowercase; child lookup by name or alias is a single hash probe.
 */
class CommandNode {
public:
    virtual ~CommandNode() = default;

    const std::string& name() const { return data_.name; }
    const std::set<std::string>& aliases() const { return data_.aliases; }
    const std::string& description() const { return data_.description; }
    const std::optional<std::string>& usage() const { return data_.usage; }
    const std::optional<std::string>& permission() const {
        return data_.permission;
    }
    bool player_only() const { return data_.player_only; }
    const std::vector<ArgumentSpec>& arguments() const {
        return data_.arguments;
    }
    const std::vector<FlagSpec>& flags() const { return data_.flags; }
    const std::optional<CooldownSpec>& cooldown() const {
        return data_.cooldown;
    }
    const std::map<std::string, SubNodePtr>& children() const {
        return data_.children;
    }
    const CompiledExecutor& executor() const { return data_.executor; }

    bool is_executable() const { return static_cast<bool>(data_.executor); }
    bool has_children() const { return !data_.children.empty(); }
    bool matches(const std::string& name_or_alias) const;
    SubNodePtr child(const std::string& name_or_alias) const;

    // Declared usage if any, else "/label <required> [optional=default] [flags]"
    std::string generate_usage(const std::string& label) const;

    virtual bool is_root() const = 0;

protected:
    explicit CommandNode(NodeData data);

private:
    NodeData data_;
    std::unordered_map<std::string, std::string> child_aliases_;
};

class SubNode final : public CommandNode {
public:
    explicit SubNode(NodeData data) : CommandNode(std::move(data)) {}
    bool is_root() const override { return false; }
};

class RootNode final : public CommandNode {
public:
    RootNode(std::string owner, NodeData data)
        : CommandNode(std::move(data)), owner_(std::move(owner)) {}

    const std::string& owner() const { return owner_; }
    bool is_root() const override { return true; }

private:
    std::string owner_;
};

// Fluent assembly shared by both node shapes. build() canonicalizes casing,
// validates specs and rejects sibling name or alias collisions.
template <typename Derived>
class NodeBuilder {
public:
    explicit NodeBuilder(std::string name) { data_.name = std::move(name); }

    Derived& alias(std::string alias) {
        pending_aliases_.push_back(std::move(alias));
        return self();
    }
    Derived& aliases(const std::vector<std::string>& aliases) {
        pending_aliases_.insert(pending_aliases_.end(), aliases.begin(),
                                aliases.end());
        return self();
    }
    Derived& description(std::string description) {
        data_.description = std::move(description);
        return self();
    }
    Derived& usage(std::string usage) {
        data_.usage = std::move(usage);
        return self();
    }
    Derived& permission(std::string permission) {
        if (permission.empty()) {
            data_.permission.reset();
        } else {
            data_.permission = std::move(permission);
        }
        return self();
    }
    Derived& player_only(bool value = true) {
        data_.player_only = value;
        return self();
    }
    Derived& argument(ArgumentSpec spec) {
        data_.arguments.push_back(std::move(spec));
        return self();
    }
    Derived& flag(FlagSpec spec) {
        data_.flags.push_back(std::move(spec));
        return self();
    }
    Derived& cooldown(CooldownSpec spec) {
        data_.cooldown = std::move(spec);
        return self();
    }
    Derived& child(SubNodePtr child) {
        pending_children_.push_back(std::move(child));
        return self();
    }
    Derived& executor(CompiledExecutor executor) {
        data_.executor = std::move(executor);
        return self();
    }

protected:
    NodeData finish() const;

private:
    Derived& self() { return static_cast<Derived&>(*this); }

    NodeData data_;
    std::vector<std::string> pending_aliases_;
    std::vector<SubNodePtr> pending_children_;
};

class SubNodeBuilder : public NodeBuilder<SubNodeBuilder> {
public:
    using NodeBuilder::NodeBuilder;
    SubNodePtr build() const;
};

class RootNodeBuilder : public NodeBuilder<RootNodeBuilder> {
public:
    RootNodeBuilder(std::string owner, std::string name)
        : NodeBuilder(std::move(name)), owner_(std::move(owner)) {}
    RootNodePtr build() const;

private:
    std::string owner_;
};

extern template class NodeBuilder<SubNodeBuilder>;
extern template class NodeBuilder<RootNodeBuilder>;

}  // namespace sigil::command

#include "sigil/command/command_node.hpp"

#include <cctype>

#include "sigil/command/errors.hpp"
#include "sigil/command/text.hpp"

namespace sigil::command {

namespace {

void check_label(const std::string& label, const std::string& what) {
    if (label.empty()) {
        throw ProcessingException(what + " cannot be empty");
    }
    for (char c : label) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            throw ProcessingException(what + " '" + label +
                                      "' cannot contain whitespace");
        }
    }
}

}  // namespace

CommandNode::CommandNode(NodeData data) : data_(std::move(data)) {
    for (const auto& [name, node] : data_.children) {
        for (const auto& alias : node->aliases()) {
            child_aliases_.emplace(alias, name);
        }
    }
}

bool CommandNode::matches(const std::string& name_or_alias) const {
    const auto key = text::to_lower(name_or_alias);
    return key == data_.name || data_.aliases.count(key) > 0;
}

SubNodePtr CommandNode::child(const std::string& name_or_alias) const {
    const auto key = text::to_lower(name_or_alias);
    if (auto it = data_.children.find(key); it != data_.children.end()) {
        return it->second;
    }
    if (auto alias = child_aliases_.find(key); alias != child_aliases_.end()) {
        return data_.children.at(alias->second);
    }
    return nullptr;
}

std::string CommandNode::generate_usage(const std::string& label) const {
    if (data_.usage) {
        return *data_.usage;
    }
    std::string usage = "/" + label;
    for (const auto& arg : data_.arguments) {
        if (arg.is_required()) {
            usage += " <" + arg.name + ">";
            continue;
        }
        usage += " [" + arg.name;
        if (arg.default_value) {
            usage += "=" + *arg.default_value;
        }
        usage += "]";
    }
    if (!data_.flags.empty()) {
        usage += " [flags]";
    }
    return usage;
}

template <typename Derived>
NodeData NodeBuilder<Derived>::finish() const {
    NodeData data = data_;
    data.name = text::to_lower(data.name);
    check_label(data.name, "Command name");

    data.aliases.clear();
    for (const auto& alias : pending_aliases_) {
        auto lower = text::to_lower(alias);
        check_label(lower, "Alias of '" + data.name + "'");
        if (lower != data.name) {
            data.aliases.insert(std::move(lower));
        }
    }

    validate_specs(data.name, data.arguments, data.flags);

    // Every child name and alias must be unique among its siblings
    std::set<std::string> taken;
    for (const auto& child : pending_children_) {
        if (!child) {
            throw ProcessingException("'" + data.name + "' has a null child");
        }
        if (!taken.insert(child->name()).second) {
            throw ProcessingException("'" + data.name +
                                      "' has conflicting children named '" +
                                      child->name() + "'");
        }
        for (const auto& alias : child->aliases()) {
            if (!taken.insert(alias).second) {
                throw ProcessingException(
                    "'" + data.name + "': alias '" + alias + "' of '" +
                    child->name() + "' collides with a sibling");
            }
        }
        data.children[child->name()] = child;
    }
    return data;
}

template class NodeBuilder<SubNodeBuilder>;
template class NodeBuilder<RootNodeBuilder>;

SubNodePtr SubNodeBuilder::build() const {
    return std::make_shared<SubNode>(finish());
}

RootNodePtr RootNodeBuilder::build() const {
    auto data = finish();
    if (owner_.empty()) {
        throw ProcessingException("Root command '" + data.name +
                                  "' has no owner");
    }
    return std::make_shared<RootNode>(owner_, std::move(data));
}

}  // namespace sigil::command

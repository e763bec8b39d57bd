#include "sigil/command/command_processor.hpp"

#include "sigil/log/logger.hpp"

namespace sigil::command {

RootNodePtr CommandProcessor::compile(const std::string& owner,
                                      const CommandSpec& spec) const {
    if (owner.empty()) {
        throw ProcessingException("Command '" + spec.name() +
                                  "' has no owner");
    }
    RootNodeBuilder builder(owner, spec.name());
    apply_common(builder, owner, spec.name(), spec);
    auto root = builder.build();
    SIGIL_LOG_DEBUG << "Compiled command '" << root->name() << "' for "
                    << owner << " (" << root->children().size()
                    << " subcommands)";
    return root;
}

SubNodePtr CommandProcessor::compile_child(const std::string& owner,
                                           const std::string& path,
                                           const CommandSpec& spec) const {
    SubNodeBuilder builder(spec.name());
    apply_common(builder, owner, path, spec);
    auto node = builder.build();
    if (!node->is_executable() && !node->has_children()) {
        throw ProcessingException("Subcommand '" + path +
                                  "' has neither an executor nor children");
    }
    return node;
}

template <typename Builder>
void CommandProcessor::apply_common(Builder& builder, const std::string& owner,
                                    const std::string& path,
                                    const CommandSpec& spec) const {
    builder.aliases(spec.aliases())
        .description(spec.description())
        .permission(spec.permission())
        .player_only(spec.is_player_only())
        .executor(spec.compiled_executor());
    if (spec.usage()) {
        builder.usage(*spec.usage());
    }
    for (const auto& argument : spec.arguments()) {
        builder.argument(argument);
    }
    for (const auto& flag : spec.flags()) {
        builder.flag(flag);
    }
    if (const auto& cooldown = spec.cooldown_spec()) {
        if (cooldown->duration.count() <= 0) {
            throw ProcessingException("Cooldown of '" + path +
                                      "' must be positive");
        }
        builder.cooldown(*cooldown);
    }
    check_types(owner, path, spec);
    for (const auto& child : spec.children()) {
        builder.child(compile_child(owner, path + " " + child.name(), child));
    }
}

void CommandProcessor::check_types(const std::string& owner,
                                   const std::string& path,
                                   const CommandSpec& spec) const {
    const auto& arguments = spec.arguments();
    for (size_t i = 0; i < arguments.size(); ++i) {
        const auto& argument = arguments[i];
        auto type = types_.get_for_owner(owner, argument.type_name);
        if (!type) {
            SIGIL_LOG_WARN << "Argument '" << argument.name << "' of '" << path
                           << "' uses unknown type '" << argument.type_name
                           << "'";
            continue;
        }
        if (type->is_greedy() && i + 1 != arguments.size()) {
            throw ProcessingException("'" + path + "': greedy argument '" +
                                      argument.name + "' must be the last one");
        }
    }
}

}  // namespace sigil::command

#include "sigil/command/handler_definition.hpp"

#include <sstream>

#include "sigil/log/logger.hpp"

namespace sigil::command {

namespace {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> words;
    std::istringstream stream(path);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    if (words.size() == 1 && text::to_lower(words.front()) == "default") {
        words.clear();
    }
    return words;
}

}  // namespace

void SubcommandDeclaration::lower_into(CommandSpec& root) const {
    const auto words = split_path(path_);
    CommandSpec* target = &root;
    for (const auto& word : words) {
        target = &target->child(word);
    }

    if (target->compiled_executor()) {
        throw ProcessingException("Duplicate handler for '" + root.name() +
                                  (words.empty() ? "" : " " + path_) + "'");
    }

    auto bound = binder_();
    for (auto& argument : bound.arguments) {
        target->argument(std::move(argument));
    }
    for (auto& flag : bound.flags) {
        target->flag(std::move(flag));
    }
    target->executor(std::move(bound.executor));

    if (!aliases_.empty()) {
        if (words.empty()) {
            SIGIL_LOG_WARN << "Aliases on the default handler of '"
                           << root.name() << "' are ignored";
        } else {
            target->aliases(aliases_);
        }
    }
    if (!description_.empty()) {
        target->description(description_);
    }
    if (usage_) {
        target->usage(*usage_);
    }
    if (!permission_.empty()) {
        target->permission(permission_);
    }
    if (player_only_) {
        target->player_only();
    }
    if (cooldown_) {
        target->cooldown(cooldown_->duration, cooldown_->bypass_permission,
                         cooldown_->message_key);
    }
}

CommandSpec HandlerDefinitionBase::to_spec() const {
    auto spec = CommandSpec::root(name_);
    spec.aliases(aliases_).description(description_).permission(permission_);
    for (const auto& subcommand : subcommands_) {
        subcommand->lower_into(spec);
    }
    SIGIL_LOG_DEBUG << "Lowered handler '" << name_ << "' with "
                    << subcommands_.size() << " methods";
    return spec;
}

}  // namespace sigil::command

#include "sigil/command/message_catalog.hpp"

#include <mutex>

#include "sigil/log/logger.hpp"

namespace sigil::command {

const std::map<std::string, std::string>& MessageCatalog::defaults() {
    static const std::map<std::string, std::string> messages = {
        {"errors.no-permission", "You don't have permission to do this."},
        {"errors.player-only", "This command can only be used by players."},
        {"errors.internal",
         "An internal error occurred. Please contact an administrator."},
        {"commands.unknown-command", "Unknown command: {command}"},
        {"commands.unknown-subcommand", "Unknown subcommand: {subcommand}"},
        {"commands.usage", "Usage: {usage}"},
        {"commands.cooldown",
         "Please wait {remaining} before using {command} again."},
        {"commands.help.header", "=== Help: {command} ({page}/{pages}) ==="},
        {"commands.help.line", " {usage} - {description}"},
        {"commands.help.footer", "Use {command} help <page> for more."},
        {"commands.help.hint", "Type {command} for help."},
        {"commands.help.empty", "No subcommands available."},
        {"commands.errors.missing-argument", "Missing argument: {argument}"},
        {"commands.errors.invalid-argument",
         "Invalid value '{value}' for {argument}: {reason}"},
        {"commands.errors.too-many-arguments",
         "Too many arguments (expected {expected}, got {got})."},
        {"commands.errors.player-not-online", "Player {player} is not online."},
        {"commands.errors.player-never-joined",
         "Player {player} has never joined."},
        {"commands.errors.invalid-number", "'{value}' is not a valid number."},
        {"commands.errors.number-out-of-range",
         "Number must be between {min} and {max}."},
        {"commands.errors.world-not-found", "World {world} was not found."},
        {"commands.errors.invalid-enum",
         "'{value}' is not valid. Options: {options}"},
    };
    return messages;
}

std::string MessageCatalog::apply(const std::string& pattern,
                                  const Placeholders& placeholders) {
    std::string result;
    result.reserve(pattern.size());
    size_t pos = 0;
    while (pos < pattern.size()) {
        const auto open = pattern.find('{', pos);
        if (open == std::string::npos) {
            result.append(pattern, pos, std::string::npos);
            break;
        }
        const auto close = pattern.find('}', open + 1);
        if (close == std::string::npos) {
            result.append(pattern, pos, std::string::npos);
            break;
        }
        result.append(pattern, pos, open - pos);
        const std::string name = pattern.substr(open + 1, close - open - 1);
        bool replaced = false;
        for (const auto& [key, value] : placeholders) {
            if (key == name) {
                result += value;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            // Unknown placeholders stay visible
            result.append(pattern, open, close - open + 1);
        }
        pos = close + 1;
    }
    return result;
}

MessageCatalog::MessageCatalog() = default;

void MessageCatalog::set_overrides(std::map<std::string, std::string> overrides) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    overrides_ = std::move(overrides);
}

void MessageCatalog::register_owner_messages(
    const std::string& owner, std::map<std::string, std::string> messages) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    by_owner_[owner] = std::move(messages);
    SIGIL_LOG_DEBUG << "Registered " << by_owner_[owner].size()
                    << " messages for " << owner;
}

void MessageCatalog::unregister_owner_messages(const std::string& owner) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    by_owner_.erase(owner);
}

std::string MessageCatalog::resolve(const std::string& owner,
                                    const std::string& key) const {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (auto scope = by_owner_.find(owner); scope != by_owner_.end()) {
            if (auto it = scope->second.find(key); it != scope->second.end()) {
                return it->second;
            }
        }
        if (auto it = overrides_.find(key); it != overrides_.end()) {
            return it->second;
        }
    }
    const auto& builtin = defaults();
    if (auto it = builtin.find(key); it != builtin.end()) {
        return it->second;
    }
    SIGIL_LOG_WARN << "No message found for key: " << key;
    return key;
}

std::string MessageCatalog::render(const std::string& owner,
                                   const std::string& key,
                                   const Placeholders& placeholders) const {
    return apply(resolve(owner, key), placeholders);
}

void MessageCatalog::send(ICommandSender& sender, const std::string& owner,
                          const std::string& key,
                          const Placeholders& placeholders) const {
    sender.send_message(render(owner, key, placeholders));
}

}  // namespace sigil::command

#pragma once

#include <string>

namespace sigil::command {

enum class SenderKind { PLAYER, CONSOLE, REMOTE };

/**
 * @brief Identity handle supplied by the host for each invocation.
 *
 * Console and remote senders are never rate-limited and cannot run
 * player-only commands.
 */
class ICommandSender {
public:
    virtual ~ICommandSender() = default;

    virtual std::string name() const = 0;
    // Stable identity used for cooldown keys (uuid for players)
    virtual std::string id() const = 0;
    virtual SenderKind kind() const = 0;
    virtual bool has_permission(const std::string& permission) const = 0;
    virtual void send_message(const std::string& message) = 0;

    // Visibility of another actor, used to filter actor suggestions
    virtual bool can_see(const std::string& actor_name) const {
        (void)actor_name;
        return true;
    }

    bool is_player() const { return kind() == SenderKind::PLAYER; }
};

}  // namespace sigil::command

#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sigil/command/sender.hpp"

namespace sigil::command {

using Placeholders = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief User-facing message templates with {placeholder} substitution.
 *
 * Lookup order: owner overrides, configured overrides, built-in defaults.
 * An unknown key renders as the key itself.
 */
class MessageCatalog {
public:
    MessageCatalog();

    static const std::map<std::string, std::string>& defaults();
    static std::string apply(const std::string& pattern,
                             const Placeholders& placeholders);

    void set_overrides(std::map<std::string, std::string> overrides);
    void register_owner_messages(const std::string& owner,
                                 std::map<std::string, std::string> messages);
    void unregister_owner_messages(const std::string& owner);

    std::string resolve(const std::string& owner, const std::string& key) const;
    std::string render(const std::string& owner, const std::string& key,
                       const Placeholders& placeholders = {}) const;
    void send(ICommandSender& sender, const std::string& owner,
              const std::string& key,
              const Placeholders& placeholders = {}) const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::string> overrides_;
    std::unordered_map<std::string, std::map<std::string, std::string>>
        by_owner_;
};

}  // namespace sigil::command

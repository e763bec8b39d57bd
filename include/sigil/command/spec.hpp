#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sigil::command {

struct ArgumentSpec {
    std::string name;
    std::string type_name = "string";
    bool optional = false;
    // Raw text, parsed through the argument's type when applied
    std::optional<std::string> default_value;
    std::string description;

    bool is_required() const { return !optional && !default_value; }
};

struct FlagSpec {
    std::string name;
    std::optional<char> short_name;
    bool has_value = false;
    std::string value_type = "string";
    std::optional<std::string> default_value;
    std::string description;
};

struct CooldownSpec {
    std::chrono::milliseconds duration{0};
    // Empty means no bypass
    std::string bypass_permission;
    // Empty means the default "commands.cooldown" template
    std::string message_key;
};

// Throws ProcessingException on:
//  - a required argument after an optional one
//  - duplicate argument names
//  - duplicate flag names or short names (case-insensitive)
//  - a flag using the reserved "help" / "h" names
void validate_specs(const std::string& path,
                    const std::vector<ArgumentSpec>& arguments,
                    const std::vector<FlagSpec>& flags);

}  // namespace sigil::command

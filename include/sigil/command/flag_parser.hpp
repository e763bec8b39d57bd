#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "sigil/command/parsed_flags.hpp"
#include "sigil/command/spec.hpp"

namespace sigil::command {

/**
 * @brief Splits a token list into flags and positional tokens.
 *
 * Grammar, per token:
 *  - "--" ends flag parsing; every later token is positional
 *  - "--name=value" sets a value explicitly
 *  - "--name" takes the next token when the flag carries a value
 *  - "-abc" expands to short flags; a value-carrying short flag takes the rest
 *    of the token, or the next token when it is the last character
 *  - "-5", "-3.14" are positional
 * Unknown flags are recorded as present booleans under their literal name.
 * Parsing never fails.
 */
class FlagParser {
public:
    struct Result {
        ParsedFlags flags;
        std::vector<std::string> remaining;
    };

    explicit FlagParser(const std::vector<FlagSpec>& specs);

    Result parse(const std::vector<std::string>& tokens) const;

private:
    size_t parse_long(const std::vector<std::string>& tokens, size_t index,
                      ParsedFlags::Builder& flags) const;
    size_t parse_short(const std::vector<std::string>& tokens, size_t index,
                       ParsedFlags::Builder& flags) const;

    std::unordered_map<std::string, FlagSpec> long_flags_;
    std::unordered_map<char, FlagSpec> short_flags_;
    std::vector<FlagSpec> specs_;
};

}  // namespace sigil::command

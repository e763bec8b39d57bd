#pragma once

#include <string>
#include <vector>

#include "sigil/command/argument_type_registry.hpp"
#include "sigil/command/parsed_args.hpp"
#include "sigil/command/parsed_flags.hpp"
#include "sigil/command/sender.hpp"
#include "sigil/command/spec.hpp"

namespace sigil::command {

/**
 * @brief Binds positional tokens to argument specs.
 *
 * Specs are walked in order. A missing token falls back to the spec's
 * default (parsed through the same type), is skipped when the spec is
 * optional, and otherwise raises MissingArgumentException. Extra tokens are
 * joined into a trailing greedy argument or raise TooManyArgumentsException.
 */
class ArgumentParser {
public:
    struct Result {
        ParsedArgs args;
        ParsedFlags flags;
    };

    explicit ArgumentParser(const ArgumentTypeRegistry& registry)
        : registry_(registry) {}

    ParsedArgs parse(const ICommandSender& sender, const std::string& owner,
                     const std::vector<std::string>& positional,
                     const std::vector<ArgumentSpec>& specs) const;

    // Flags first, then positional arguments from what the flags left over
    Result parse_input(const ICommandSender& sender, const std::string& owner,
                       const std::vector<std::string>& tokens,
                       const std::vector<ArgumentSpec>& arguments,
                       const std::vector<FlagSpec>& flags) const;

    // Suggestions for the spec under the cursor (the last token). Never
    // throws; failures yield an empty list.
    std::vector<std::string> suggest(const ICommandSender& sender,
                                     const std::string& owner,
                                     const std::vector<std::string>& positional,
                                     const std::vector<ArgumentSpec>& specs) const;

    // Index of the spec under the cursor, or -1 past the last non-greedy spec
    static int cursor_position(size_t token_count,
                               const std::vector<ArgumentSpec>& specs,
                               bool last_is_greedy);

    ArgumentTypePtr resolve_type(const std::string& owner,
                                 const std::string& type_name) const {
        return registry_.get_for_owner(owner, type_name);
    }

private:
    const ArgumentTypeRegistry& registry_;
};

}  // namespace sigil::command

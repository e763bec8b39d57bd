#pragma once

#include <any>
#include <memory>
#include <string>
#include <vector>

#include "sigil/command/sender.hpp"

namespace sigil::command {

struct ParseContext {
    const ICommandSender& sender;
    // Owner of the command being parsed, empty for global lookups
    std::string owner;
    std::string argument;
};

/**
 * @brief Named parser and suggester for one kind of positional value.
 *
 * parse() throws ArgumentTypeError with a machine-readable reason code.
 * suggest() may return an unfiltered list; callers apply prefix filtering.
 */
class IArgumentType {
public:
    virtual ~IArgumentType() = default;

    virtual std::any parse(const ParseContext& ctx,
                           const std::string& input) const = 0;
    virtual std::vector<std::string> suggest(const ICommandSender& sender,
                                             const std::string& partial) const {
        (void)sender;
        (void)partial;
        return {};
    }
    virtual std::string type_name() const = 0;
    // Greedy types consume every remaining token, joined by a single space
    virtual bool is_greedy() const { return false; }
};

using ArgumentTypePtr = std::shared_ptr<const IArgumentType>;

}  // namespace sigil::command

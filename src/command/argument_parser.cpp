#include "sigil/command/argument_parser.hpp"

#include <unordered_map>

#include "sigil/command/errors.hpp"
#include "sigil/command/flag_parser.hpp"
#include "sigil/command/text.hpp"
#include "sigil/log/logger.hpp"

namespace sigil::command {

ParsedArgs ArgumentParser::parse(const ICommandSender& sender,
                                 const std::string& owner,
                                 const std::vector<std::string>& positional,
                                 const std::vector<ArgumentSpec>& specs) const {
    std::unordered_map<std::string, std::any> values;
    size_t index = 0;

    for (const auto& spec : specs) {
        auto type = resolve_type(owner, spec.type_name);
        if (!type) {
            throw UnknownArgumentTypeException(spec.name, spec.type_name);
        }
        ParseContext ctx{sender, owner, spec.name};

        if (index >= positional.size()) {
            if (spec.default_value) {
                try {
                    values[spec.name] = type->parse(ctx, *spec.default_value);
                } catch (const ArgumentTypeError& e) {
                    throw InvalidArgumentValueException(spec.name, e.input(),
                                                        e.reason());
                }
                continue;
            }
            if (spec.optional) {
                continue;
            }
            throw MissingArgumentException(spec.name);
        }

        const bool greedy = type->is_greedy();
        const std::string raw =
            greedy ? text::join(positional, index) : positional[index];
        try {
            values[spec.name] = type->parse(ctx, raw);
        } catch (const ArgumentTypeError& e) {
            throw InvalidArgumentValueException(spec.name, e.input(),
                                                e.reason());
        }
        index = greedy ? positional.size() : index + 1;
    }

    if (index < positional.size()) {
        throw TooManyArgumentsException(specs.size(), positional.size());
    }

    return ParsedArgs(std::move(values), positional);
}

ArgumentParser::Result ArgumentParser::parse_input(
    const ICommandSender& sender, const std::string& owner,
    const std::vector<std::string>& tokens,
    const std::vector<ArgumentSpec>& arguments,
    const std::vector<FlagSpec>& flags) const {
    auto flag_result = FlagParser(flags).parse(tokens);
    auto args = parse(sender, owner, flag_result.remaining, arguments);
    return Result{std::move(args), std::move(flag_result.flags)};
}

int ArgumentParser::cursor_position(size_t token_count,
                                    const std::vector<ArgumentSpec>& specs,
                                    bool last_is_greedy) {
    if (specs.empty()) {
        return -1;
    }
    const size_t position = token_count == 0 ? 0 : token_count - 1;
    if (position < specs.size()) {
        return static_cast<int>(position);
    }
    return last_is_greedy ? static_cast<int>(specs.size() - 1) : -1;
}

std::vector<std::string> ArgumentParser::suggest(
    const ICommandSender& sender, const std::string& owner,
    const std::vector<std::string>& positional,
    const std::vector<ArgumentSpec>& specs) const {
    if (specs.empty()) {
        return {};
    }
    auto last_type = resolve_type(owner, specs.back().type_name);
    const int position = cursor_position(positional.size(), specs,
                                         last_type && last_type->is_greedy());
    if (position < 0) {
        return {};
    }

    const auto& spec = specs[static_cast<size_t>(position)];
    auto type = resolve_type(owner, spec.type_name);
    if (!type) {
        return {};
    }
    const std::string partial = positional.empty() ? "" : positional.back();
    try {
        return type->suggest(sender, partial);
    } catch (const std::exception& e) {
        SIGIL_LOG_DEBUG << "Suggestion for argument '" << spec.name
                        << "' failed: " << e.what();
        return {};
    }
}

}  // namespace sigil::command

#include "sigil/command/flag_parser.hpp"

#include <cctype>

#include "sigil/command/text.hpp"

namespace sigil::command {

namespace {

char lower_char(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

}  // namespace

FlagParser::FlagParser(const std::vector<FlagSpec>& specs) : specs_(specs) {
    for (const auto& spec : specs_) {
        long_flags_[text::to_lower(spec.name)] = spec;
        if (spec.short_name) {
            short_flags_[lower_char(*spec.short_name)] = spec;
        }
    }
}

FlagParser::Result FlagParser::parse(
    const std::vector<std::string>& tokens) const {
    ParsedFlags::Builder flags;
    for (const auto& spec : specs_) {
        if (spec.default_value) {
            flags.set_default(spec.name, *spec.default_value);
        }
    }

    std::vector<std::string> remaining;
    bool flags_ended = false;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (flags_ended) {
            remaining.push_back(token);
            continue;
        }
        if (token == "--") {
            flags_ended = true;
            continue;
        }
        if (token.rfind("--", 0) == 0) {
            i = parse_long(tokens, i, flags);
            continue;
        }
        if (token.size() > 1 && token[0] == '-' && !text::is_numeric(token)) {
            i = parse_short(tokens, i, flags);
            continue;
        }
        remaining.push_back(token);
    }

    return Result{flags.build(), std::move(remaining)};
}

size_t FlagParser::parse_long(const std::vector<std::string>& tokens,
                              size_t index,
                              ParsedFlags::Builder& flags) const {
    const std::string body = tokens[index].substr(2);

    const auto eq = body.find('=');
    if (eq != std::string::npos && eq > 0) {
        flags.set(body.substr(0, eq), body.substr(eq + 1));
        return index;
    }

    const auto name = text::to_lower(body);
    auto it = long_flags_.find(name);
    if (it == long_flags_.end()) {
        flags.set_present(name);
        return index;
    }
    if (it->second.has_value && index + 1 < tokens.size()) {
        flags.set(it->second.name, tokens[index + 1]);
        return index + 1;
    }
    flags.set_present(it->second.name);
    return index;
}

size_t FlagParser::parse_short(const std::vector<std::string>& tokens,
                               size_t index,
                               ParsedFlags::Builder& flags) const {
    const std::string chars = tokens[index].substr(1);
    for (size_t i = 0; i < chars.size(); ++i) {
        const char c = lower_char(chars[i]);
        auto it = short_flags_.find(c);
        if (it == short_flags_.end()) {
            flags.set_present(std::string(1, c));
            continue;
        }
        const auto& spec = it->second;
        if (!spec.has_value) {
            flags.set_present(spec.name);
            continue;
        }
        if (i + 1 < chars.size()) {
            flags.set(spec.name, chars.substr(i + 1));
            return index;
        }
        if (index + 1 < tokens.size()) {
            flags.set(spec.name, tokens[index + 1]);
            return index + 1;
        }
        flags.set_present(spec.name);
        return index;
    }
    return index;
}

}  // namespace sigil::command

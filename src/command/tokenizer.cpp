#include "sigil/command/tokenizer.hpp"

#include <cctype>

#include "sigil/command/text.hpp"

namespace sigil::command {

std::vector<std::string> tokenize(const std::string& input,
                                  bool keep_trailing_empty) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_quotes = false;
    bool escape = false;
    bool token_started = false;

    for (char c : input) {
        if (escape) {
            current += c;
            escape = false;
            continue;
        }
        if (c == '\\' && in_quotes) {
            escape = true;
            continue;
        }
        if (c == '"') {
            in_quotes = !in_quotes;
            token_started = true;
            continue;
        }
        if (!in_quotes && std::isspace(static_cast<unsigned char>(c))) {
            if (token_started) {
                tokens.push_back(std::move(current));
                current.clear();
                token_started = false;
            }
            continue;
        }
        current += c;
        token_started = true;
    }

    if (token_started) {
        tokens.push_back(std::move(current));
    } else if (keep_trailing_empty && !input.empty() &&
               std::isspace(static_cast<unsigned char>(input.back()))) {
        tokens.emplace_back();
    }
    return tokens;
}

std::vector<std::string> retokenize(const std::vector<std::string>& args,
                                    bool keep_trailing_empty) {
    if (args.empty()) {
        return {};
    }
    auto tokens = tokenize(text::join(args, 0), keep_trailing_empty);
    // A host that reports the in-progress word as "" keeps it as the last token
    if (keep_trailing_empty && args.back().empty() &&
        (tokens.empty() || !tokens.back().empty())) {
        tokens.emplace_back();
    }
    return tokens;
}

CommandLine split_command_line(const std::string& line) {
    static const char* const WHITESPACE = " \t\r\n";
    CommandLine result;
    const auto start = line.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) {
        return result;
    }
    const auto end = line.find_first_of(WHITESPACE, start);
    result.label = line.substr(
        start, end == std::string::npos ? std::string::npos : end - start);
    if (!result.label.empty() && result.label.front() == '/') {
        result.label.erase(0, 1);
    }
    if (end != std::string::npos) {
        result.rest = line.substr(end + 1);
        result.has_rest = true;
    }
    return result;
}

}  // namespace sigil::command

#include "sigil/command/text.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <cctype>
#include <charconv>

namespace sigil::command::text {

std::string to_lower(std::string_view value) {
    return boost::algorithm::to_lower_copy(std::string(value));
}

bool starts_with_ignore_case(std::string_view value, std::string_view prefix) {
    return boost::algorithm::istarts_with(value, prefix);
}

bool less_ignore_case(const std::string& a, const std::string& b) {
    return boost::algorithm::ilexicographical_compare(a, b);
}

bool is_numeric(std::string_view value) {
    size_t i = 0;
    if (!value.empty() && (value[0] == '-' || value[0] == '+')) {
        i = 1;
    }
    bool digit_seen = false;
    bool dot_seen = false;
    for (; i < value.size(); ++i) {
        const char c = value[i];
        if (c == '.') {
            if (dot_seen) return false;
            dot_seen = true;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            digit_seen = true;
        } else {
            return false;
        }
    }
    return digit_seen;
}

std::optional<long long> parse_integer(std::string_view value) {
    if (!value.empty() && value[0] == '+') {
        value.remove_prefix(1);
        // from_chars would accept a second sign after the stripped '+'
        if (!value.empty() && (value[0] == '+' || value[0] == '-')) {
            return std::nullopt;
        }
    }
    if (value.empty()) {
        return std::nullopt;
    }
    long long result = 0;
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

std::optional<double> parse_decimal(std::string_view value) {
    if (!value.empty() && value[0] == '+') {
        value.remove_prefix(1);
        // from_chars would accept a second sign after the stripped '+'
        if (!value.empty() && (value[0] == '+' || value[0] == '-')) {
            return std::nullopt;
        }
    }
    if (value.empty()) {
        return std::nullopt;
    }
    double result = 0;
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

std::optional<bool> parse_boolean(std::string_view value) {
    const auto lower = to_lower(value);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1" ||
        lower == "enable" || lower == "enabled") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0" ||
        lower == "disable" || lower == "disabled") {
        return false;
    }
    return std::nullopt;
}

std::string join(const std::vector<std::string>& parts, size_t from,
                 const std::string& separator) {
    std::string result;
    for (size_t i = from; i < parts.size(); ++i) {
        if (i > from) result += separator;
        result += parts[i];
    }
    return result;
}

}  // namespace sigil::command::text

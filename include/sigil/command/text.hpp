#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sigil::command::text {

std::string to_lower(std::string_view value);

// Case-insensitive prefix test used by every completion filter
bool starts_with_ignore_case(std::string_view value, std::string_view prefix);
bool less_ignore_case(const std::string& a, const std::string& b);

// Optional sign, digits and at most one '.', at least one digit
bool is_numeric(std::string_view value);

std::optional<long long> parse_integer(std::string_view value);
std::optional<double> parse_decimal(std::string_view value);
// true/yes/on/1/enable/enabled and their negatives
std::optional<bool> parse_boolean(std::string_view value);

std::string join(const std::vector<std::string>& parts, size_t from,
                 const std::string& separator = " ");

}  // namespace sigil::command::text

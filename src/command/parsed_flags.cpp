#include "sigil/command/parsed_flags.hpp"

#include <limits>

#include "sigil/command/text.hpp"

namespace sigil::command {

ParsedFlags::Builder& ParsedFlags::Builder::set(const std::string& name,
                                                std::string value) {
    values_[text::to_lower(name)] = std::move(value);
    return *this;
}

ParsedFlags::Builder& ParsedFlags::Builder::set_present(
    const std::string& name) {
    values_[text::to_lower(name)] = "true";
    return *this;
}

ParsedFlags::Builder& ParsedFlags::Builder::set_default(
    const std::string& name, std::string value) {
    defaults_[text::to_lower(name)] = std::move(value);
    return *this;
}

ParsedFlags ParsedFlags::Builder::build() {
    ParsedFlags flags;
    flags.values_ = std::move(values_);
    flags.defaults_ = std::move(defaults_);
    return flags;
}

bool ParsedFlags::has(const std::string& name) const {
    return values_.count(text::to_lower(name)) > 0;
}

std::optional<std::string> ParsedFlags::value(const std::string& name) const {
    const auto key = text::to_lower(name);
    if (auto it = values_.find(key); it != values_.end()) {
        return it->second;
    }
    if (auto it = defaults_.find(key); it != defaults_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string ParsedFlags::value_or(const std::string& name,
                                  const std::string& fallback) const {
    auto found = value(name);
    return found ? *found : fallback;
}

std::optional<int> ParsedFlags::get_int(const std::string& name) const {
    auto raw = value(name);
    if (!raw) return std::nullopt;
    auto parsed = text::parse_integer(*raw);
    if (!parsed || *parsed < std::numeric_limits<int>::min() ||
        *parsed > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(*parsed);
}

std::optional<double> ParsedFlags::get_double(const std::string& name) const {
    auto raw = value(name);
    if (!raw) return std::nullopt;
    return text::parse_decimal(*raw);
}

bool ParsedFlags::get_bool(const std::string& name) const {
    auto raw = value(name);
    if (!raw) return false;
    return text::parse_boolean(*raw).value_or(false);
}

std::vector<std::string> ParsedFlags::names() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [name, value] : values_) {
        result.push_back(name);
    }
    return result;
}

}  // namespace sigil::command

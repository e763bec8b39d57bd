#pragma once

#include <any>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sigil/command/errors.hpp"

namespace sigil::command {

// Typed positional values keyed by argument name.
class ParsedArgs {
public:
    ParsedArgs() = default;
    ParsedArgs(std::unordered_map<std::string, std::any> values,
               std::vector<std::string> positional)
        : values_(std::move(values)), positional_(std::move(positional)) {}

    bool has(const std::string& name) const {
        return values_.find(name) != values_.end();
    }

    template <typename T>
    const T& get(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) {
            throw CommandException("Argument '" + name + "' was not supplied");
        }
        const T* value = std::any_cast<T>(&it->second);
        if (value == nullptr) {
            throw CommandException("Argument '" + name +
                                   "' does not hold the requested type");
        }
        return *value;
    }

    template <typename T>
    std::optional<T> get_optional(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) {
            return std::nullopt;
        }
        const T* value = std::any_cast<T>(&it->second);
        if (value == nullptr) {
            return std::nullopt;
        }
        return *value;
    }

    template <typename T>
    T get_or(const std::string& name, T fallback) const {
        auto value = get_optional<T>(name);
        return value ? *value : std::move(fallback);
    }

    const std::any* raw(const std::string& name) const {
        auto it = values_.find(name);
        return it == values_.end() ? nullptr : &it->second;
    }

    // Tokens as they were seen after flag removal
    const std::vector<std::string>& positional() const { return positional_; }
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_map<std::string, std::any> values_;
    std::vector<std::string> positional_;
};

}  // namespace sigil::command

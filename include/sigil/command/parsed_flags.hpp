#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sigil::command {

/**
 * @brief Flags seen on the command line, keyed by lowercase long name.
 *
 * Boolean flags are stored with the value "true". Declared defaults are kept
 * apart so has() only reports flags the user actually typed.
 */
class ParsedFlags {
public:
    class Builder {
    public:
        Builder& set(const std::string& name, std::string value);
        Builder& set_present(const std::string& name);
        Builder& set_default(const std::string& name, std::string value);
        ParsedFlags build();

    private:
        std::map<std::string, std::string> values_;
        std::map<std::string, std::string> defaults_;
    };

    ParsedFlags() = default;

    bool has(const std::string& name) const;
    std::optional<std::string> value(const std::string& name) const;
    std::string value_or(const std::string& name,
                         const std::string& fallback) const;
    std::optional<int> get_int(const std::string& name) const;
    std::optional<double> get_double(const std::string& name) const;
    // Present boolean flags and truthy values read as true
    bool get_bool(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::map<std::string, std::string> values_;
    std::map<std::string, std::string> defaults_;
};

}  // namespace sigil::command

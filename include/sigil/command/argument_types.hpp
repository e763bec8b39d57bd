#pragma once

#include <algorithm>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sigil/command/argument_type.hpp"
#include "sigil/command/errors.hpp"
#include "sigil/command/host.hpp"
#include "sigil/command/text.hpp"

namespace sigil::command {

// Single token, returned unchanged (std::string)
class StringType : public IArgumentType {
public:
    std::any parse(const ParseContext& ctx,
                   const std::string& input) const override;
    std::string type_name() const override { return "string"; }
};

// Rest of the line (std::string)
class GreedyStringType : public IArgumentType {
public:
    std::any parse(const ParseContext& ctx,
                   const std::string& input) const override;
    std::string type_name() const override { return "greedyString"; }
    bool is_greedy() const override { return true; }
};

// int, optionally bounded (inclusive)
class IntegerType : public IArgumentType {
public:
    IntegerType(int min = std::numeric_limits<int>::min(),
                int max = std::numeric_limits<int>::max())
        : min_(min), max_(max) {}

    std::any parse(const ParseContext& ctx,
                   const std::string& input) const override;
    std::vector<std::string> suggest(const ICommandSender& sender,
                                     const std::string& partial) const override;
    std::string type_name() const override;

private:
    int min_;
    int max_;
};

// double, optionally bounded (inclusive); NaN is rejected
class DoubleType : public IArgumentType {
public:
    DoubleType(double min = -std::numeric_limits<double>::infinity(),
               double max = std::numeric_limits<double>::infinity())
        : min_(min), max_(max) {}

    std::any parse(const ParseContext& ctx,
                   const std::string& input) const override;
    std::string type_name() const override;

private:
    double min_;
    double max_;
};

class BooleanType : public IArgumentType {
public:
    std::any parse(const ParseContext& ctx,
                   const std::string& input) const override;
    std::vector<std::string> suggest(const ICommandSender& sender,
                                     const std::string& partial) const override;
    std::string type_name() const override { return "boolean"; }
};

// Case-insensitive lookup of an enumerator by name, yields E
template <typename E>
class EnumType : public IArgumentType {
public:
    EnumType(std::string name, std::vector<std::pair<std::string, E>> values)
        : name_(text::to_lower(name)) {
        for (auto& [key, value] : values) {
            values_.emplace_back(text::to_lower(key), value);
        }
    }

    std::any parse(const ParseContext& ctx,
                   const std::string& input) const override {
        (void)ctx;
        const auto lower = text::to_lower(input);
        for (const auto& [key, value] : values_) {
            if (key == lower) {
                return value;
            }
        }
        throw ArgumentTypeError(input, "invalid-enum:" + joined_names());
    }

    std::vector<std::string> suggest(const ICommandSender& sender,
                                     const std::string& partial) const override {
        (void)sender;
        std::vector<std::string> result;
        for (const auto& [key, value] : values_) {
            if (text::starts_with_ignore_case(key, partial)) {
                result.push_back(key);
            }
        }
        return result;
    }

    std::string type_name() const override { return name_; }

private:
    std::string joined_names() const {
        std::string result;
        for (const auto& [key, value] : values_) {
            if (!result.empty()) result += ", ";
            result += key;
        }
        return result;
    }

    std::string name_;
    std::vector<std::pair<std::string, E>> values_;
};

// Online actor by name (ActorRef); reason "player-not-online"
class OnlineActorType : public IArgumentType {
public:
    explicit OnlineActorType(std::shared_ptr<const IHostDirectory> directory)
        : directory_(std::move(directory)) {}

    std::any parse(const ParseContext& ctx,
                   const std::string& input) const override;
    std::vector<std::string> suggest(const ICommandSender& sender,
                                     const std::string& partial) const override;
    std::string type_name() const override { return "player"; }

private:
    std::shared_ptr<const IHostDirectory> directory_;
};

// Any previously seen actor by id or name (ActorRef); reason
// "player-never-joined"
class OfflineActorType : public IArgumentType {
public:
    explicit OfflineActorType(std::shared_ptr<const IHostDirectory> directory)
        : directory_(std::move(directory)) {}

    std::any parse(const ParseContext& ctx,
                   const std::string& input) const override;
    std::vector<std::string> suggest(const ICommandSender& sender,
                                     const std::string& partial) const override;
    std::string type_name() const override { return "playerOffline"; }

private:
    std::shared_ptr<const IHostDirectory> directory_;
};

// World by name (WorldRef); reason "world-not-found"
class WorldType : public IArgumentType {
public:
    explicit WorldType(std::shared_ptr<const IHostDirectory> directory)
        : directory_(std::move(directory)) {}

    std::any parse(const ParseContext& ctx,
                   const std::string& input) const override;
    std::vector<std::string> suggest(const ICommandSender& sender,
                                     const std::string& partial) const override;
    std::string type_name() const override { return "world"; }

private:
    std::shared_ptr<const IHostDirectory> directory_;
};

}  // namespace sigil::command

#include "sigil/command/argument_types.hpp"

#include <cmath>
#include <sstream>

namespace sigil::command {

namespace {

std::string format_decimal(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::vector<std::string> sorted_visible_names(
    const std::vector<ActorRef>& actors, const ICommandSender& sender,
    const std::string& partial) {
    std::vector<std::string> names;
    for (const auto& actor : actors) {
        if (sender.can_see(actor.name) &&
            text::starts_with_ignore_case(actor.name, partial)) {
            names.push_back(actor.name);
        }
    }
    std::sort(names.begin(), names.end(), text::less_ignore_case);
    return names;
}

}  // namespace

std::any StringType::parse(const ParseContext& ctx,
                           const std::string& input) const {
    (void)ctx;
    return input;
}

std::any GreedyStringType::parse(const ParseContext& ctx,
                                 const std::string& input) const {
    (void)ctx;
    return input;
}

std::any IntegerType::parse(const ParseContext& ctx,
                            const std::string& input) const {
    (void)ctx;
    auto value = text::parse_integer(input);
    if (!value || *value < std::numeric_limits<int>::min() ||
        *value > std::numeric_limits<int>::max()) {
        throw ArgumentTypeError(input, "invalid-number");
    }
    if (*value < min_ || *value > max_) {
        throw ArgumentTypeError(input, "number-out-of-range:" +
                                           std::to_string(min_) + ":" +
                                           std::to_string(max_));
    }
    return static_cast<int>(*value);
}

std::vector<std::string> IntegerType::suggest(const ICommandSender& sender,
                                              const std::string& partial) const {
    (void)sender;
    std::vector<std::string> result;
    if (min_ < 0 || max_ > 100) {
        return result;
    }
    for (int candidate : {1, 5, 10, 25, 50, 100}) {
        const auto text_value = std::to_string(candidate);
        if (candidate >= min_ && candidate <= max_ &&
            text_value.rfind(partial, 0) == 0) {
            result.push_back(text_value);
        }
    }
    return result;
}

std::string IntegerType::type_name() const {
    constexpr int lowest = std::numeric_limits<int>::min();
    constexpr int highest = std::numeric_limits<int>::max();
    if (min_ != lowest && max_ != highest) {
        return "integer(" + std::to_string(min_) + "-" + std::to_string(max_) +
               ")";
    }
    if (min_ != lowest) {
        return "integer(>=" + std::to_string(min_) + ")";
    }
    if (max_ != highest) {
        return "integer(<=" + std::to_string(max_) + ")";
    }
    return "integer";
}

std::any DoubleType::parse(const ParseContext& ctx,
                           const std::string& input) const {
    (void)ctx;
    auto value = text::parse_decimal(input);
    if (!value) {
        throw ArgumentTypeError(input, "invalid-number");
    }
    if (std::isnan(*value)) {
        throw ArgumentTypeError(input, "not-a-number");
    }
    if (*value < min_ || *value > max_) {
        throw ArgumentTypeError(input, "number-out-of-range:" +
                                           format_decimal(min_) + ":" +
                                           format_decimal(max_));
    }
    return *value;
}

std::string DoubleType::type_name() const {
    const bool bounded_below = std::isfinite(min_);
    const bool bounded_above = std::isfinite(max_);
    if (bounded_below && bounded_above) {
        return "number(" + format_decimal(min_) + "-" + format_decimal(max_) +
               ")";
    }
    if (bounded_below) {
        return "number(>=" + format_decimal(min_) + ")";
    }
    if (bounded_above) {
        return "number(<=" + format_decimal(max_) + ")";
    }
    return "number";
}

std::any BooleanType::parse(const ParseContext& ctx,
                            const std::string& input) const {
    (void)ctx;
    auto value = text::parse_boolean(input);
    if (!value) {
        throw ArgumentTypeError(input, "invalid-boolean");
    }
    return *value;
}

std::vector<std::string> BooleanType::suggest(const ICommandSender& sender,
                                              const std::string& partial) const {
    (void)sender;
    std::vector<std::string> result;
    for (const char* candidate : {"true", "false"}) {
        if (text::starts_with_ignore_case(candidate, partial)) {
            result.emplace_back(candidate);
        }
    }
    return result;
}

std::any OnlineActorType::parse(const ParseContext& ctx,
                                const std::string& input) const {
    (void)ctx;
    auto actor = directory_->find_online_actor(input);
    if (!actor) {
        throw ArgumentTypeError(input, "player-not-online");
    }
    return *actor;
}

std::vector<std::string> OnlineActorType::suggest(
    const ICommandSender& sender, const std::string& partial) const {
    return sorted_visible_names(directory_->online_actors(), sender, partial);
}

std::any OfflineActorType::parse(const ParseContext& ctx,
                                 const std::string& input) const {
    (void)ctx;
    if (auto online = directory_->find_online_actor(input)) {
        return *online;
    }
    auto actor = directory_->find_known_actor(input);
    if (!actor) {
        throw ArgumentTypeError(input, "player-never-joined");
    }
    return *actor;
}

std::vector<std::string> OfflineActorType::suggest(
    const ICommandSender& sender, const std::string& partial) const {
    return sorted_visible_names(directory_->online_actors(), sender, partial);
}

std::any WorldType::parse(const ParseContext& ctx,
                          const std::string& input) const {
    (void)ctx;
    auto world = directory_->find_world(input);
    if (!world) {
        throw ArgumentTypeError(input, "world-not-found");
    }
    return *world;
}

std::vector<std::string> WorldType::suggest(const ICommandSender& sender,
                                            const std::string& partial) const {
    (void)sender;
    std::vector<std::string> names;
    for (const auto& world : directory_->worlds()) {
        if (text::starts_with_ignore_case(world.name, partial)) {
            names.push_back(world.name);
        }
    }
    std::sort(names.begin(), names.end(), text::less_ignore_case);
    return names;
}

}  // namespace sigil::command

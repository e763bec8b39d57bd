#pragma once

#include <chrono>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "sigil/command/command_context.hpp"
#include "sigil/command/command_node.hpp"
#include "sigil/command/command_spec.hpp"
#include "sigil/command/errors.hpp"
#include "sigil/command/host.hpp"
#include "sigil/command/spec.hpp"
#include "sigil/command/text.hpp"

namespace sigil::command {

namespace param {

struct ContextParam {};
struct SenderParam {};

struct ArgParam {
    std::string name;
    std::optional<std::string> type_name;
    std::optional<std::string> default_value;
    bool is_optional = false;
    std::string description;

    ArgParam& type(std::string value) {
        type_name = std::move(value);
        return *this;
    }
    ArgParam& defaults(std::string value) {
        default_value = std::move(value);
        is_optional = true;
        return *this;
    }
    ArgParam& optional() {
        is_optional = true;
        return *this;
    }
    ArgParam& describe(std::string value) {
        description = std::move(value);
        return *this;
    }
};

struct FlagParam {
    std::string name;
    std::optional<char> short_name;
    std::optional<std::string> default_value;
    std::string description;

    FlagParam& defaults(std::string value) {
        default_value = std::move(value);
        return *this;
    }
    FlagParam& describe(std::string value) {
        description = std::move(value);
        return *this;
    }
};

using Decl = std::variant<ContextParam, SenderParam, ArgParam, FlagParam>;

inline ContextParam context() { return {}; }
inline SenderParam sender() { return {}; }
inline ArgParam arg(std::string name) { return ArgParam{std::move(name)}; }
inline FlagParam flag(std::string name,
                      std::optional<char> short_name = std::nullopt) {
    return FlagParam{std::move(name), short_name};
}

}  // namespace param

namespace detail {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct unwrap_optional {
    using type = T;
};
template <typename T>
struct unwrap_optional<std::optional<T>> {
    using type = T;
};

template <typename P>
using decayed_t = std::remove_cv_t<std::remove_reference_t<P>>;

// Argument type name inferred from the parameter's value type
template <typename V>
std::optional<std::string> inferred_type_name() {
    if constexpr (std::is_same_v<V, std::string>) return "string";
    else if constexpr (std::is_same_v<V, int>) return "integer";
    else if constexpr (std::is_same_v<V, double>) return "double";
    else if constexpr (std::is_same_v<V, bool>) return "boolean";
    else if constexpr (std::is_same_v<V, ActorRef>) return "player";
    else if constexpr (std::is_same_v<V, WorldRef>) return "world";
    else return std::nullopt;
}

template <typename P>
using held_t = std::conditional_t<
    std::is_same_v<decayed_t<P>, CommandContext>,
    std::reference_wrapper<CommandContext>,
    std::conditional_t<std::is_same_v<decayed_t<P>, ICommandSender>,
                       std::reference_wrapper<ICommandSender>, decayed_t<P>>>;

struct BindingPlan {
    std::string path;
    std::vector<ArgumentSpec> arguments;
    std::vector<FlagSpec> flags;
};

template <typename P>
struct ParamBinder {
    std::function<held_t<P>(CommandContext&)> fetch;
};

[[noreturn]] inline void bad_parameter(const BindingPlan& plan, size_t index,
                                       const std::string& why) {
    throw ProcessingException("'" + plan.path + "' parameter #" +
                              std::to_string(index) + ": " + why);
}

template <typename V>
V parse_flag_number(const std::string& flag, const std::string& raw) {
    if constexpr (std::is_same_v<V, int>) {
        auto value = text::parse_integer(raw);
        if (!value || *value < std::numeric_limits<int>::min() ||
            *value > std::numeric_limits<int>::max()) {
            throw InvalidArgumentValueException(flag, raw, "invalid-number");
        }
        return static_cast<int>(*value);
    } else {
        auto value = text::parse_decimal(raw);
        if (!value) {
            throw InvalidArgumentValueException(flag, raw, "invalid-number");
        }
        return *value;
    }
}

template <typename P>
ParamBinder<P> make_arg_binder(const param::ArgParam& decl, size_t index,
                               BindingPlan& plan) {
    using D = decayed_t<P>;
    using Value = typename unwrap_optional<D>::type;
    constexpr bool wraps_optional = is_optional<D>::value;

    auto type_name = decl.type_name ? decl.type_name
                                    : inferred_type_name<Value>();
    if (!type_name) {
        bad_parameter(plan, index,
                      "cannot infer an argument type for '" + decl.name +
                          "'; declare one with .type()");
    }
    const bool optional = decl.is_optional || wraps_optional;
    if (optional && !decl.default_value && !wraps_optional) {
        bad_parameter(plan, index,
                      "optional argument '" + decl.name +
                          "' without a default must bind to std::optional");
    }
    plan.arguments.push_back(ArgumentSpec{decl.name, *type_name, optional,
                                          decl.default_value,
                                          decl.description});

    const std::string name = decl.name;
    if constexpr (wraps_optional) {
        return {[name](CommandContext& ctx) -> D {
            return ctx.args().get_optional<Value>(name);
        }};
    } else {
        return {[name](CommandContext& ctx) -> D {
            return ctx.args().get<Value>(name);
        }};
    }
}

template <typename P>
ParamBinder<P> make_flag_binder(const param::FlagParam& decl, size_t index,
                                BindingPlan& plan) {
    using D = decayed_t<P>;
    using Value = typename unwrap_optional<D>::type;
    constexpr bool wraps_optional = is_optional<D>::value;
    const std::string name = decl.name;

    if constexpr (std::is_same_v<D, bool>) {
        plan.flags.push_back(FlagSpec{decl.name, decl.short_name, false,
                                      "boolean", decl.default_value,
                                      decl.description});
        return {[name](CommandContext& ctx) -> D {
            return ctx.flags().get_bool(name);
        }};
    } else if constexpr (std::is_same_v<Value, std::string>) {
        plan.flags.push_back(FlagSpec{decl.name, decl.short_name, true,
                                      "string", decl.default_value,
                                      decl.description});
        if constexpr (wraps_optional) {
            return {[name](CommandContext& ctx) -> D {
                return ctx.flags().value(name);
            }};
        } else {
            return {[name](CommandContext& ctx) -> D {
                return ctx.flags().value_or(name, "");
            }};
        }
    } else if constexpr (std::is_same_v<Value, int> ||
                         std::is_same_v<Value, double>) {
        plan.flags.push_back(FlagSpec{
            decl.name, decl.short_name, true,
            std::is_same_v<Value, int> ? "integer" : "double",
            decl.default_value, decl.description});
        return {[name](CommandContext& ctx) -> D {
            auto raw = ctx.flags().value(name);
            if (!raw) {
                return D{};
            }
            return parse_flag_number<Value>(name, *raw);
        }};
    } else {
        bad_parameter(plan, index,
                      "flag '" + decl.name +
                          "' must bind to bool, std::string, int, double or "
                          "std::optional of those");
    }
}

template <typename P>
ParamBinder<P> make_binder(const param::Decl& decl, size_t index,
                           BindingPlan& plan) {
    using D = decayed_t<P>;
    static_assert(std::is_same_v<D, CommandContext> ||
                      std::is_same_v<D, ICommandSender> ||
                      !std::is_lvalue_reference_v<P> ||
                      std::is_const_v<std::remove_reference_t<P>>,
                  "Value parameters must be taken by value or const reference");
    constexpr bool is_context = std::is_same_v<D, CommandContext>;
    constexpr bool is_sender = std::is_same_v<D, ICommandSender>;

    if (std::holds_alternative<param::ContextParam>(decl)) {
        if constexpr (is_context) {
            return {[](CommandContext& ctx) { return std::ref(ctx); }};
        } else {
            bad_parameter(plan, index, "context() needs a CommandContext&");
        }
    }
    if (std::holds_alternative<param::SenderParam>(decl)) {
        if constexpr (is_sender) {
            return {[](CommandContext& ctx) { return std::ref(ctx.sender()); }};
        } else {
            bad_parameter(plan, index, "sender() needs an ICommandSender&");
        }
    }
    if constexpr (is_context || is_sender) {
        bad_parameter(plan, index,
                      "context and sender parameters take no name");
    } else {
        if (const auto* arg = std::get_if<param::ArgParam>(&decl)) {
            return make_arg_binder<P>(*arg, index, plan);
        }
        return make_flag_binder<P>(std::get<param::FlagParam>(decl), index,
                                   plan);
    }
}

template <typename... Args, size_t... I>
std::tuple<ParamBinder<Args>...> make_binders(
    const std::vector<param::Decl>& decls, BindingPlan& plan,
    std::index_sequence<I...>) {
    // Braced initialization keeps left-to-right order for the plan
    return std::tuple<ParamBinder<Args>...>{
        make_binder<Args>(decls[I], I, plan)...};
}

struct BoundMethod {
    CompiledExecutor executor;
    std::vector<ArgumentSpec> arguments;
    std::vector<FlagSpec> flags;
};

template <typename T, typename Method, typename R, typename... Args>
BoundMethod bind_method(std::shared_ptr<T> receiver, Method method,
                        const std::vector<param::Decl>& decls,
                        const std::string& path) {
    BindingPlan plan{path, {}, {}};
    if (decls.size() != sizeof...(Args)) {
        throw ProcessingException(
            "'" + path + "' declares " + std::to_string(decls.size()) +
            " parameters but the method takes " +
            std::to_string(sizeof...(Args)));
    }
    auto binders = make_binders<Args...>(decls, plan,
                                         std::index_sequence_for<Args...>{});

    CompiledExecutor executor(
        [receiver, method, binders](CommandContext& ctx) -> bool {
            return std::apply(
                [&](const auto&... binder) -> bool {
                    if constexpr (std::is_void_v<R>) {
                        ((*receiver).*method)(binder.fetch(ctx)...);
                        return true;
                    } else {
                        return static_cast<bool>(
                            ((*receiver).*method)(binder.fetch(ctx)...));
                    }
                },
                binders);
        });
    return BoundMethod{std::move(executor), std::move(plan.arguments),
                       std::move(plan.flags)};
}

}  // namespace detail

// Metadata for one handler method; chain setters on the returned reference.
class SubcommandDeclaration {
public:
    using Binder = std::function<detail::BoundMethod()>;

    SubcommandDeclaration(std::string path, Binder binder)
        : path_(std::move(path)), binder_(std::move(binder)) {}

    SubcommandDeclaration& aliases(std::vector<std::string> aliases) {
        aliases_ = std::move(aliases);
        return *this;
    }
    SubcommandDeclaration& description(std::string description) {
        description_ = std::move(description);
        return *this;
    }
    SubcommandDeclaration& usage(std::string usage) {
        usage_ = std::move(usage);
        return *this;
    }
    SubcommandDeclaration& permission(std::string permission) {
        permission_ = std::move(permission);
        return *this;
    }
    SubcommandDeclaration& player_only(bool value = true) {
        player_only_ = value;
        return *this;
    }
    SubcommandDeclaration& cooldown(std::chrono::milliseconds duration,
                                    std::string bypass_permission = "",
                                    std::string message_key = "") {
        cooldown_ = CooldownSpec{duration, std::move(bypass_permission),
                                 std::move(message_key)};
        return *this;
    }

    const std::string& path() const { return path_; }
    // Applies this declaration to the command tree rooted at root
    void lower_into(CommandSpec& root) const;

private:
    std::string path_;
    Binder binder_;
    std::vector<std::string> aliases_;
    std::string description_;
    std::optional<std::string> usage_;
    std::string permission_;
    bool player_only_ = false;
    std::optional<CooldownSpec> cooldown_;
};

class HandlerDefinitionBase {
public:
    explicit HandlerDefinitionBase(std::string name) : name_(std::move(name)) {}
    virtual ~HandlerDefinitionBase() = default;

    HandlerDefinitionBase(HandlerDefinitionBase&&) = default;
    HandlerDefinitionBase& operator=(HandlerDefinitionBase&&) = default;

    // Binds every method and produces the equivalent fluent declaration.
    // Throws ProcessingException on malformed declarations.
    CommandSpec to_spec() const;

    const std::string& name() const { return name_; }

protected:
    std::string name_;
    std::vector<std::string> aliases_;
    std::string description_;
    std::string permission_;
    std::vector<std::unique_ptr<SubcommandDeclaration>> subcommands_;
};

/**
 * @brief Reflective-style registration: a receiver object plus a list of
 * methods, each with an explicit parameter plan.
 *
 * @code
 * HandlerDefinition<Economy>(economy, "eco")
 *     .permission("demo.eco")
 *     .subcommand("give", &Economy::give,
 *                 {param::sender(), param::arg("target"), param::arg("amount")});
 * @endcode
 *
 * Argument types are inferred from parameter types unless given with
 * .type(); std::optional parameters make optional arguments. The path ""
 * or "default" binds the root's own executor and multi-word paths create
 * intermediate groups.
 */
template <typename T>
class HandlerDefinition : public HandlerDefinitionBase {
public:
    HandlerDefinition(std::shared_ptr<T> receiver, std::string name)
        : HandlerDefinitionBase(std::move(name)),
          receiver_(std::move(receiver)) {
        if (!receiver_) {
            throw ProcessingException("Handler '" + name_ + "' has no receiver");
        }
    }

    HandlerDefinition& aliases(std::vector<std::string> aliases) {
        aliases_ = std::move(aliases);
        return *this;
    }
    HandlerDefinition& description(std::string description) {
        description_ = std::move(description);
        return *this;
    }
    HandlerDefinition& permission(std::string permission) {
        permission_ = std::move(permission);
        return *this;
    }

    template <typename R, typename... Args>
    SubcommandDeclaration& subcommand(std::string path,
                                      R (T::*method)(Args...),
                                      std::vector<param::Decl> params = {}) {
        return add<R, Args...>(std::move(path), method, std::move(params));
    }

    template <typename R, typename... Args>
    SubcommandDeclaration& subcommand(std::string path,
                                      R (T::*method)(Args...) const,
                                      std::vector<param::Decl> params = {}) {
        return add<R, Args...>(std::move(path), method, std::move(params));
    }

private:
    template <typename R, typename... Args, typename Method>
    SubcommandDeclaration& add(std::string path, Method method,
                               std::vector<param::Decl> params) {
        static_assert(std::is_void_v<R> || std::is_convertible_v<R, bool>,
                      "Handler methods must return void or bool");
        const std::string full_path = name_ + (path.empty() ? "" : " " + path);
        auto binder = [receiver = receiver_, method,
                       params = std::move(params), full_path]() {
            return detail::bind_method<T, Method, R, Args...>(
                receiver, method, params, full_path);
        };
        subcommands_.push_back(std::make_unique<SubcommandDeclaration>(
            std::move(path), std::move(binder)));
        return *subcommands_.back();
    }

    std::shared_ptr<T> receiver_;
};

}  // namespace sigil::command

#include "sigil/command/command_dispatcher.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <boost/algorithm/string/predicate.hpp>

#include "sigil/command/command_context.hpp"
#include "sigil/command/text.hpp"
#include "sigil/command/tokenizer.hpp"
#include "sigil/log/logger.hpp"

namespace sigil::command {

namespace {

bool is_help_flag(const std::string& token) {
    return boost::algorithm::iequals(token, "--help") ||
           boost::algorithm::iequals(token, "-h") || token == "-?";
}

std::string reason_code(const std::string& reason) {
    return reason.substr(0, reason.find(':'));
}

std::string reason_part(const std::string& reason, size_t index) {
    size_t start = 0;
    for (size_t i = 0; i < index; ++i) {
        start = reason.find(':', start);
        if (start == std::string::npos) {
            return "?";
        }
        ++start;
    }
    const auto end = reason.find(':', start);
    return reason.substr(start, end == std::string::npos ? std::string::npos
                                                         : end - start);
}

}  // namespace

const char* to_string(DispatchStatus status) {
    switch (status) {
        case DispatchStatus::SUCCESS: return "SUCCESS";
        case DispatchStatus::HANDLER_RETURNED_FALSE: return "HANDLER_RETURNED_FALSE";
        case DispatchStatus::UNKNOWN_COMMAND: return "UNKNOWN_COMMAND";
        case DispatchStatus::UNKNOWN_SUBCOMMAND: return "UNKNOWN_SUBCOMMAND";
        case DispatchStatus::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case DispatchStatus::PLAYER_ONLY: return "PLAYER_ONLY";
        case DispatchStatus::COOLDOWN_ACTIVE: return "COOLDOWN_ACTIVE";
        case DispatchStatus::PARSE_ERROR: return "PARSE_ERROR";
        case DispatchStatus::HELP_SHOWN: return "HELP_SHOWN";
        case DispatchStatus::USAGE_SHOWN: return "USAGE_SHOWN";
        case DispatchStatus::HANDLER_ERROR: return "HANDLER_ERROR";
    }
    return "UNKNOWN";
}

CommandDispatcher::CommandDispatcher(const CommandGraph& graph,
                                     const ArgumentTypeRegistry& types,
                                     CooldownTracker& cooldowns,
                                     const MessageCatalog& messages,
                                     std::shared_ptr<const IHostDirectory> host)
    : graph_(graph),
      cooldowns_(cooldowns),
      messages_(messages),
      host_(std::move(host)),
      parser_(types),
      help_(messages) {}

void CommandDispatcher::configure(const DispatcherSettings& settings) {
    help_page_size_ = settings.help_page_size == 0 ? 1 : settings.help_page_size;
    slow_threshold_us_ = settings.slow_threshold.count();
    debug_ = settings.debug;
}

DispatcherSettings CommandDispatcher::settings() const {
    DispatcherSettings settings;
    settings.help_page_size = help_page_size_.load();
    settings.slow_threshold = std::chrono::microseconds(slow_threshold_us_.load());
    settings.debug = debug_.load();
    return settings;
}

std::string CommandDispatcher::format_remaining(
    std::chrono::milliseconds remaining) {
    const auto total_ms = remaining.count() < 0 ? 0 : remaining.count();
    std::ostringstream out;
    if (total_ms < 60000) {
        out << std::fixed << std::setprecision(1) << (total_ms / 1000.0) << "s";
        return out.str();
    }
    const auto total_s = total_ms / 1000;
    const auto hours = total_s / 3600;
    const auto minutes = (total_s % 3600) / 60;
    const auto seconds = total_s % 60;
    if (hours > 0) {
        out << hours << "h ";
    }
    out << minutes << "m " << seconds << "s";
    return out.str();
}

DispatchResult CommandDispatcher::dispatch_line(ICommandSender& sender,
                                               const std::string& line) {
    const auto parts = split_command_line(line);
    if (parts.label.empty()) {
        return DispatchResult{DispatchStatus::UNKNOWN_COMMAND, "", "", {}};
    }
    std::vector<std::string> args;
    if (parts.has_rest) {
        args.push_back(parts.rest);
    }
    return dispatch(sender, parts.label, args);
}

DispatchResult CommandDispatcher::dispatch(ICommandSender& sender,
                                           const std::string& label,
                                           const std::vector<std::string>& args) {
    const auto started = std::chrono::steady_clock::now();
    DispatchResult result;
    try {
        result = run(sender, label, args);
    } catch (const std::exception& e) {
        SIGIL_LOG_ERROR << "Dispatch of '" << label << "' failed: " << e.what();
        messages_.send(sender, "", "errors.internal");
        result = DispatchResult{DispatchStatus::HANDLER_ERROR, label, e.what(), {}};
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);
    if (debug_ && elapsed.count() > slow_threshold_us_) {
        SIGIL_LOG_WARN << "Slow command '" << label << "': " << elapsed.count()
                       << "us (" << to_string(result.status) << ")";
    }
    return result;
}

DispatchResult CommandDispatcher::run(ICommandSender& sender,
                                      const std::string& label,
                                      const std::vector<std::string>& args) {
    std::vector<std::string> tokens{label};
    for (auto& token : retokenize(args)) {
        tokens.push_back(std::move(token));
    }

    const auto resolution = graph_.resolve(tokens);
    if (!resolution.found()) {
        messages_.send(sender, "", "commands.unknown-command",
                       {{"command", label}});
        return DispatchResult{DispatchStatus::UNKNOWN_COMMAND, "", label, {}};
    }

    const auto& owner = resolution.root->owner();
    const auto& node = *resolution.node;
    const auto path = resolution.path_string();
    const auto& remaining = resolution.remaining;

    try {
        authorize(sender, resolution);
    } catch (const PermissionDeniedException& e) {
        SIGIL_LOG_DEBUG << sender.name() << " lacks " << e.permission()
                        << " for /" << path;
        messages_.send(sender, owner, "errors.no-permission");
        return DispatchResult{DispatchStatus::PERMISSION_DENIED, path,
                              e.permission(), {}};
    } catch (const PlayerOnlyException&) {
        messages_.send(sender, owner, "errors.player-only");
        return DispatchResult{DispatchStatus::PLAYER_ONLY, path, "", {}};
    }

    int page = 1;
    if (wants_help(resolution, page)) {
        // "help" on a leaf lists the root instead
        const bool leaf_keyword = !remaining.empty() &&
                                  boost::algorithm::iequals(remaining[0], "help") &&
                                  !node.has_children();
        if (leaf_keyword) {
            help_.render(sender, owner, resolution.root->name(),
                         *resolution.root, page, help_page_size_);
        } else {
            help_.render(sender, owner, path, node, page, help_page_size_);
        }
        return DispatchResult{DispatchStatus::HELP_SHOWN, path, "", {}};
    }

    if (!node.is_executable()) {
        if (!remaining.empty() && node.has_children()) {
            messages_.send(sender, owner, "commands.unknown-subcommand",
                           {{"subcommand", remaining[0]}, {"command", "/" + path}});
            messages_.send(sender, owner, "commands.help.hint",
                           {{"command", "/" + path + " help"}});
            return DispatchResult{DispatchStatus::UNKNOWN_SUBCOMMAND, path,
                                  remaining[0], {}};
        }
        if (node.has_children()) {
            help_.render(sender, owner, path, node, 1, help_page_size_);
            return DispatchResult{DispatchStatus::HELP_SHOWN, path, "", {}};
        }
        send_usage(sender, owner, resolution);
        return DispatchResult{DispatchStatus::USAGE_SHOWN, path, "", {}};
    }

    try {
        acquire_cooldown(sender, node, path);
    } catch (const CooldownActiveException& e) {
        const auto& message_key = node.cooldown()->message_key;
        messages_.send(sender, owner,
                       message_key.empty() ? std::string("commands.cooldown")
                                           : message_key,
                       {{"remaining", format_remaining(e.remaining())},
                        {"command", "/" + path}});
        return DispatchResult{DispatchStatus::COOLDOWN_ACTIVE, path, "",
                              e.remaining()};
    }

    ArgumentParser::Result parsed;
    try {
        parsed = parser_.parse_input(sender, owner, remaining, node.arguments(),
                                     node.flags());
    } catch (const ParseException& e) {
        report_parse_error(sender, owner, e);
        if (e.kind() != ParseException::Kind::UNKNOWN_TYPE) {
            send_usage(sender, owner, resolution);
        }
        return DispatchResult{DispatchStatus::PARSE_ERROR, path, e.what(), {}};
    }

    return invoke(sender, resolution, label, std::move(parsed));
}

DispatchResult CommandDispatcher::invoke(ICommandSender& sender,
                                         const Resolution& resolution,
                                         const std::string& label,
                                         ArgumentParser::Result parsed) {
    const auto& owner = resolution.root->owner();
    const auto path = resolution.path_string();
    CommandContext context(sender, owner, label, resolution.path,
                           std::move(parsed.args), std::move(parsed.flags),
                           messages_, host_);

    std::lock_guard<std::recursive_mutex> lock(invoke_mutex_);
    try {
        if (!resolution.node->executor()(context)) {
            send_usage(sender, owner, resolution);
            return DispatchResult{DispatchStatus::HANDLER_RETURNED_FALSE, path,
                                  "", {}};
        }
        return DispatchResult{DispatchStatus::SUCCESS, path, "", {}};
    } catch (const ParseException& e) {
        // Raised while converting flag values for a bound method
        report_parse_error(sender, owner, e);
        send_usage(sender, owner, resolution);
        return DispatchResult{DispatchStatus::PARSE_ERROR, path, e.what(), {}};
    } catch (const std::exception& e) {
        HandlerInvocationFailure failure(path, e.what());
        SIGIL_LOG_ERROR << failure.what() << " (sender " << sender.name()
                        << ", owner " << owner << ")";
        messages_.send(sender, owner, "errors.internal");
        return DispatchResult{DispatchStatus::HANDLER_ERROR, path, e.what(), {}};
    } catch (...) {
        HandlerInvocationFailure failure(path, "non-standard exception");
        SIGIL_LOG_ERROR << failure.what() << " (sender " << sender.name()
                        << ", owner " << owner << ")";
        messages_.send(sender, owner, "errors.internal");
        return DispatchResult{DispatchStatus::HANDLER_ERROR, path,
                              failure.what(), {}};
    }
}

void CommandDispatcher::authorize(const ICommandSender& sender,
                                  const Resolution& resolution) const {
    const auto chain = resolution.chain();
    for (const auto& step : chain) {
        const auto& permission = step->permission();
        if (permission && !sender.has_permission(*permission)) {
            throw PermissionDeniedException(*permission);
        }
    }
    for (const auto& step : chain) {
        if (step->player_only() && !sender.is_player()) {
            throw PlayerOnlyException();
        }
    }
}

void CommandDispatcher::acquire_cooldown(const ICommandSender& sender,
                                         const CommandNode& node,
                                         const std::string& path) {
    const auto& cooldown = node.cooldown();
    if (!cooldown || !sender.is_player()) {
        return;
    }
    if (!cooldown->bypass_permission.empty() &&
        sender.has_permission(cooldown->bypass_permission)) {
        return;
    }
    const auto key = CooldownTracker::make_key(sender.id(), path);
    if (auto left = cooldowns_.try_acquire(key, cooldown->duration)) {
        throw CooldownActiveException(*left);
    }
}

bool CommandDispatcher::wants_help(const Resolution& resolution,
                                   int& page) const {
    const auto& remaining = resolution.remaining;
    if (!remaining.empty() && boost::algorithm::iequals(remaining[0], "help")) {
        page = 1;
        if (remaining.size() >= 2) {
            if (auto parsed = text::parse_integer(remaining[1])) {
                page = static_cast<int>(std::clamp<long long>(*parsed, 1, 1 << 20));
            }
        }
        return true;
    }
    for (const auto& token : remaining) {
        if (token == "--") {
            break;
        }
        if (is_help_flag(token)) {
            page = 1;
            return true;
        }
    }
    return false;
}

void CommandDispatcher::report_parse_error(ICommandSender& sender,
                                           const std::string& owner,
                                           const ParseException& error) const {
    using Kind = ParseException::Kind;
    switch (error.kind()) {
        case Kind::MISSING_REQUIRED:
            messages_.send(sender, owner, "commands.errors.missing-argument",
                           {{"argument", error.argument()}});
            return;
        case Kind::TOO_MANY_ARGS:
            if (const auto* too_many =
                    dynamic_cast<const TooManyArgumentsException*>(&error)) {
                messages_.send(sender, owner,
                               "commands.errors.too-many-arguments",
                               {{"expected", std::to_string(too_many->expected())},
                                {"got", std::to_string(too_many->got())}});
                return;
            }
            break;
        case Kind::UNKNOWN_TYPE:
            SIGIL_LOG_WARN << error.what();
            messages_.send(sender, owner, "errors.internal");
            return;
        case Kind::INVALID_VALUE:
            break;
    }

    const auto* invalid =
        dynamic_cast<const InvalidArgumentValueException*>(&error);
    if (!invalid) {
        messages_.send(sender, owner, "commands.errors.invalid-argument",
                       {{"value", ""},
                        {"argument", error.argument()},
                        {"reason", error.what()}});
        return;
    }
    const auto& value = invalid->input();
    const auto& reason = invalid->reason();
    const auto code = reason_code(reason);
    if (code == "player-not-online" || code == "player-never-joined") {
        messages_.send(sender, owner, "commands.errors." + code,
                       {{"player", value}});
    } else if (code == "invalid-number" || code == "not-a-number") {
        messages_.send(sender, owner, "commands.errors.invalid-number",
                       {{"value", value}});
    } else if (code == "number-out-of-range") {
        messages_.send(sender, owner, "commands.errors.number-out-of-range",
                       {{"min", reason_part(reason, 1)},
                        {"max", reason_part(reason, 2)}});
    } else if (code == "world-not-found") {
        messages_.send(sender, owner, "commands.errors.world-not-found",
                       {{"world", value}});
    } else if (code == "invalid-enum") {
        messages_.send(sender, owner, "commands.errors.invalid-enum",
                       {{"value", value},
                        {"options", reason.size() > code.size()
                                        ? reason.substr(code.size() + 1)
                                        : std::string()}});
    } else {
        messages_.send(sender, owner, "commands.errors.invalid-argument",
                       {{"value", value},
                        {"argument", invalid->argument()},
                        {"reason", reason}});
    }
}

void CommandDispatcher::send_usage(ICommandSender& sender,
                                   const std::string& owner,
                                   const Resolution& resolution) const {
    messages_.send(sender, owner, "commands.usage",
                   {{"usage", resolution.node->generate_usage(
                                  resolution.path_string())}});
}

}  // namespace sigil::command

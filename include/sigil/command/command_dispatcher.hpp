#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sigil/command/argument_parser.hpp"
#include "sigil/command/argument_type_registry.hpp"
#include "sigil/command/command_graph.hpp"
#include "sigil/command/cooldown_tracker.hpp"
#include "sigil/command/errors.hpp"
#include "sigil/command/help_formatter.hpp"
#include "sigil/command/host.hpp"
#include "sigil/command/message_catalog.hpp"
#include "sigil/command/sender.hpp"

namespace sigil::command {

enum class DispatchStatus {
    SUCCESS,
    HANDLER_RETURNED_FALSE,
    UNKNOWN_COMMAND,
    UNKNOWN_SUBCOMMAND,
    PERMISSION_DENIED,
    PLAYER_ONLY,
    COOLDOWN_ACTIVE,
    PARSE_ERROR,
    HELP_SHOWN,
    USAGE_SHOWN,
    HANDLER_ERROR
};

const char* to_string(DispatchStatus status);

struct DispatchResult {
    DispatchStatus status = DispatchStatus::UNKNOWN_COMMAND;
    // Canonical path of the resolved node, empty when nothing resolved
    std::string path;
    // Permission, argument name or exception text, depending on status
    std::string detail;
    std::chrono::milliseconds cooldown_remaining{0};

    bool success() const { return status == DispatchStatus::SUCCESS; }
};

struct DispatcherSettings {
    size_t help_page_size = 8;
    std::chrono::microseconds slow_threshold{500};
    bool debug = false;
};

/**
 * @brief Runs one invocation through the command pipeline.
 *
 * Resolve, authorize, rate-limit, parse and invoke, stopping at the first
 * failure. Every failure is reported to the sender through the message
 * catalog and returned as a DispatchStatus; no exception leaves dispatch().
 *
 * Executors are invoked one at a time. The invocation lock is recursive so a
 * handler may dispatch another command.
 */
class CommandDispatcher {
public:
    CommandDispatcher(const CommandGraph& graph,
                      const ArgumentTypeRegistry& types,
                      CooldownTracker& cooldowns,
                      const MessageCatalog& messages,
                      std::shared_ptr<const IHostDirectory> host = nullptr);

    // `args` are the host-supplied tokens after the label
    DispatchResult dispatch(ICommandSender& sender, const std::string& label,
                            const std::vector<std::string>& args);
    // Whole input line; a leading '/' is ignored
    DispatchResult dispatch_line(ICommandSender& sender,
                                 const std::string& line);

    void configure(const DispatcherSettings& settings);
    DispatcherSettings settings() const;

    // "1h 2m 3s" above a minute, otherwise seconds with one decimal ("4.5s")
    static std::string format_remaining(std::chrono::milliseconds remaining);

private:
    DispatchResult run(ICommandSender& sender, const std::string& label,
                       const std::vector<std::string>& args);
    DispatchResult invoke(ICommandSender& sender, const Resolution& resolution,
                          const std::string& label,
                          ArgumentParser::Result parsed);
    // Throw PermissionDeniedException or PlayerOnlyException for the first
    // node on the path the sender may not run
    void authorize(const ICommandSender& sender,
                   const Resolution& resolution) const;
    // Starts the node's cooldown window or throws CooldownActiveException
    void acquire_cooldown(const ICommandSender& sender, const CommandNode& node,
                          const std::string& path);
    bool wants_help(const Resolution& resolution, int& page) const;
    void report_parse_error(ICommandSender& sender, const std::string& owner,
                            const ParseException& error) const;
    void send_usage(ICommandSender& sender, const std::string& owner,
                    const Resolution& resolution) const;

    const CommandGraph& graph_;
    CooldownTracker& cooldowns_;
    const MessageCatalog& messages_;
    std::shared_ptr<const IHostDirectory> host_;
    ArgumentParser parser_;
    HelpFormatter help_;

    std::atomic<size_t> help_page_size_{8};
    std::atomic<int64_t> slow_threshold_us_{500};
    std::atomic<bool> debug_{false};

    std::recursive_mutex invoke_mutex_;
};

}  // namespace sigil::command

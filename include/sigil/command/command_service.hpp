#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sigil/command/argument_type_registry.hpp"
#include "sigil/command/command_config.hpp"
#include "sigil/command/command_dispatcher.hpp"
#include "sigil/command/command_graph.hpp"
#include "sigil/command/command_processor.hpp"
#include "sigil/command/command_registry.hpp"
#include "sigil/command/command_spec.hpp"
#include "sigil/command/completion_cache.hpp"
#include "sigil/command/cooldown_tracker.hpp"
#include "sigil/command/handler_definition.hpp"
#include "sigil/command/host.hpp"
#include "sigil/command/host_binder.hpp"
#include "sigil/command/message_catalog.hpp"
#include "sigil/command/tab_completer.hpp"

namespace sigil::command {

/**
 * @brief Root object of the command subsystem.
 *
 * Owns the type registry, graph, cooldowns, completion cache and message
 * catalog, and wires the processor, dispatcher and completer to them.
 */
class CommandService {
public:
    explicit CommandService(std::shared_ptr<const IHostDirectory> host = nullptr,
                            std::shared_ptr<IHostBinder> binder = nullptr);
    ~CommandService();

    CommandService(const CommandService&) = delete;
    CommandService& operator=(const CommandService&) = delete;

    // Compiles and registers; ProcessingException is logged and rethrown
    CommandRegistration register_command(const std::string& owner,
                                         const CommandSpec& spec);
    CommandRegistration register_handler(const std::string& owner,
                                         const HandlerDefinitionBase& definition);

    bool unregister(const std::string& name);
    // Drops the owner's commands, scoped argument types and messages
    size_t unregister_all(const std::string& owner);
    size_t unregister_all();

    DispatchResult dispatch(ICommandSender& sender, const std::string& label,
                            const std::vector<std::string>& args);
    DispatchResult dispatch_line(ICommandSender& sender, const std::string& line);
    std::vector<std::string> complete(const ICommandSender& sender,
                                      const std::string& label,
                                      const std::vector<std::string>& args);
    std::vector<std::string> complete_line(const ICommandSender& sender,
                                           const std::string& line);

    void apply_config(const CommandConfig& config);
    // Applies the registered CommandConfig, if any, and follows its reloads
    void watch_config();

    ArgumentTypeRegistry& types() { return types_; }
    MessageCatalog& messages() { return messages_; }
    CommandRegistry& registry() { return registry_; }
    const CommandGraph& graph() const { return graph_; }
    CooldownTracker& cooldowns() { return cooldowns_; }
    CompletionCache& completion_cache() { return cache_; }
    const CommandDispatcher& dispatcher() const { return dispatcher_; }

private:
    CommandRegistration install(const std::string& owner,
                                const CommandSpec& spec);

    std::shared_ptr<const IHostDirectory> host_;
    ArgumentTypeRegistry types_;
    CommandGraph graph_;
    CommandRegistry registry_;
    CooldownTracker cooldowns_;
    CompletionCache cache_;
    MessageCatalog messages_;
    CommandProcessor processor_;
    CommandDispatcher dispatcher_;
    TabCompleter completer_;
    // Expires with the service so late reload callbacks become no-ops
    std::shared_ptr<CommandService*> alive_;
};

}  // namespace sigil::command

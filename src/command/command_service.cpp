#include "sigil/command/command_service.hpp"

#include "sigil/log/logger.hpp"

namespace sigil::command {

CommandService::CommandService(std::shared_ptr<const IHostDirectory> host,
                               std::shared_ptr<IHostBinder> binder)
    : host_(std::move(host)),
      types_(host_),
      registry_(graph_, std::move(binder)),
      processor_(types_),
      dispatcher_(graph_, types_, cooldowns_, messages_, host_),
      completer_(graph_, types_, cache_),
      alive_(std::make_shared<CommandService*>(this)) {}

CommandService::~CommandService() { *alive_ = nullptr; }

CommandRegistration CommandService::register_command(const std::string& owner,
                                                     const CommandSpec& spec) {
    return install(owner, spec);
}

CommandRegistration CommandService::register_handler(
    const std::string& owner, const HandlerDefinitionBase& definition) {
    try {
        return install(owner, definition.to_spec());
    } catch (const ProcessingException& e) {
        SIGIL_LOG_ERROR << "Failed to register handler '" << definition.name()
                        << "' for " << owner << ": " << e.what();
        throw;
    }
}

CommandRegistration CommandService::install(const std::string& owner,
                                            const CommandSpec& spec) {
    RootNodePtr root;
    try {
        root = processor_.compile(owner, spec);
    } catch (const ProcessingException& e) {
        SIGIL_LOG_ERROR << "Failed to register /" << spec.name() << " for "
                        << owner << ": " << e.what();
        throw;
    }
    auto registration = registry_.register_root(root);
    cache_.invalidate_all();
    return registration;
}

bool CommandService::unregister(const std::string& name) {
    const bool removed = registry_.unregister(name);
    if (removed) {
        cache_.invalidate_all();
    }
    return removed;
}

size_t CommandService::unregister_all(const std::string& owner) {
    const auto removed = registry_.unregister_all(owner);
    types_.unregister_all_for_owner(owner);
    messages_.unregister_owner_messages(owner);
    cache_.invalidate_all();
    return removed;
}

size_t CommandService::unregister_all() {
    const auto removed = registry_.unregister_all();
    cache_.invalidate_all();
    cooldowns_.clear();
    return removed;
}

DispatchResult CommandService::dispatch(ICommandSender& sender,
                                        const std::string& label,
                                        const std::vector<std::string>& args) {
    return dispatcher_.dispatch(sender, label, args);
}

DispatchResult CommandService::dispatch_line(ICommandSender& sender,
                                             const std::string& line) {
    return dispatcher_.dispatch_line(sender, line);
}

std::vector<std::string> CommandService::complete(
    const ICommandSender& sender, const std::string& label,
    const std::vector<std::string>& args) {
    return completer_.complete(sender, label, args);
}

std::vector<std::string> CommandService::complete_line(
    const ICommandSender& sender, const std::string& line) {
    return completer_.complete_line(sender, line);
}

void CommandService::apply_config(const CommandConfig& config) {
    cache_.reconfigure(std::chrono::milliseconds(config.completion.ttl_ms),
                       config.completion.max_entries);
    cooldowns_.set_purge_threshold(config.cooldown_purge_threshold);
    messages_.set_overrides(config.messages);

    DispatcherSettings dispatch;
    dispatch.help_page_size = config.help_page_size;
    dispatch.slow_threshold =
        std::chrono::microseconds(config.dispatch.slow_threshold_us);
    dispatch.debug = config.debug;
    dispatcher_.configure(dispatch);

    CompleterSettings completion;
    completion.max_suggestions = config.completion.max_suggestions;
    completion.partial_key_length = config.completion.partial_key_length;
    completion.slow_threshold =
        std::chrono::microseconds(config.completion.slow_threshold_us);
    completion.debug = config.debug;
    completer_.configure(completion);

    SIGIL_LOG_DEBUG << "Command settings applied (debug=" << config.debug
                    << ", " << config.messages.size() << " message overrides)";
}

void CommandService::watch_config() {
    auto& manager = config::ConfigManager::instance();
    if (auto current = manager.get_configuration_properties<CommandConfig>()) {
        apply_config(*current);
    }
    std::weak_ptr<CommandService*> alive = alive_;
    manager.subscribe_to_reloads<CommandConfig>(
        [alive](const CommandConfig& config) {
            auto self = alive.lock();
            if (self && *self) {
                (*self)->apply_config(config);
            }
        });
}

}  // namespace sigil::command

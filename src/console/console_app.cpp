#include "sigil/console/console_app.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem.hpp>

#include "sigil/command/command_config.hpp"
#include "sigil/config/config.hpp"
#include "sigil/log/log_config.hpp"
#include "sigil/log/logger.hpp"

namespace sigil::console {

using command::CommandContext;
using command::CommandSpec;

ConsoleApp::ConsoleApp(ConsoleOptions options)
    : options_(std::move(options)),
      directory_(std::make_shared<MemoryDirectory>()),
      binder_(std::make_shared<ConsoleBinder>()) {}

ConsoleApp::~ConsoleApp() {
    if (started_) {
        log::Logger::shutdown();
    }
}

void ConsoleApp::load_configuration() {
    auto& manager = config::ConfigManager::instance();
    config::ConfigurationPropertiesFactory<log::LogConfig>::create_and_register();
    config::ConfigurationPropertiesFactory<command::CommandConfig>::create_and_register();
    config::ConfigurationPropertiesFactory<ConsoleConfig>::create_and_register();

    if (boost::filesystem::exists(options_.config_file)) {
        manager.load_config(options_.config_file);
    }

    auto log_config = manager.get_configuration_properties<log::LogConfig>();
    if (options_.log_level) {
        log_config->global_level =
            log::LogConfig::level_from_string(*options_.log_level);
    }
    log::Logger::init(*log_config);
    if (!boost::filesystem::exists(options_.config_file)) {
        SIGIL_LOG_WARN << "Config file " << options_.config_file
                       << " not found, using defaults";
    }

    const bool level_pinned = options_.log_level.has_value();
    manager.subscribe_to_reloads<log::LogConfig>(
        [level_pinned](const log::LogConfig& config) {
            if (!level_pinned) {
                log::Logger::set_level(config.global_level);
            }
        });
}

void ConsoleApp::populate_directory(const ConsoleConfig& config) {
    for (const auto& name : config.actors) {
        directory_->add_actor(name, true);
    }
    for (const auto& name : config.offline_actors) {
        directory_->add_actor(name, false);
    }
    for (const auto& name : config.worlds) {
        directory_->add_world(name);
    }
    prompt_ = config.prompt;
}

void ConsoleApp::start() {
    load_configuration();
    started_ = true;

    auto console_config =
        config::ConfigManager::instance().get_configuration_properties<ConsoleConfig>();
    populate_directory(*console_config);
    if (options_.player) {
        directory_->add_actor(*options_.player, true);
    }

    service_ = std::make_unique<command::CommandService>(directory_, binder_);
    service_->watch_config();
    demo_ = register_demo_commands(*service_);
    register_admin_command();
    SIGIL_LOG_INFO << "Console ready with " << binder_->labels().size()
                   << " command labels";
}

void ConsoleApp::register_admin_command() {
    auto spec = CommandSpec::root("sigil");
    spec.description("Console administration")
        .permission("sigil.admin")
        .sub("reload",
             [this](CommandSpec& s) {
                 s.description("Reload the configuration file")
                     .executor([this](CommandContext& ctx) {
                         const bool ok = config::ConfigManager::instance().reload_config(
                             options_.config_file);
                         ctx.reply_raw(ok ? "Configuration reloaded."
                                          : "Reload failed; see the log.");
                         return ok;
                     });
             })
        .sub("commands",
             [this](CommandSpec& s) {
                 s.description("List registered commands")
                     .optional_arg("owner")
                     .executor([this](CommandContext& ctx) {
                         auto owner = ctx.optional_arg<std::string>("owner");
                         auto registrations =
                             owner ? service_->registry().registrations(*owner)
                                   : service_->registry().registrations();
                         for (const auto& registration : registrations) {
                             std::vector<std::string> aliases(
                                 registration.aliases.begin(),
                                 registration.aliases.end());
                             ctx.reply_raw(
                                 " /" + registration.name + " [" +
                                 registration.owner + "]" +
                                 (aliases.empty()
                                      ? ""
                                      : " aliases: " +
                                            boost::algorithm::join(aliases, ", ")));
                         }
                     });
             })
        .sub("cache",
             [this](CommandSpec& s) {
                 s.description("Completion cache statistics")
                     .flag("clear", 'c')
                     .executor([this](CommandContext& ctx) {
                         auto& cache = service_->completion_cache();
                         const auto& stats = cache.statistics();
                         ctx.reply_raw(
                             "entries=" + std::to_string(cache.size()) +
                             " hits=" + std::to_string(stats.hits.load()) +
                             " misses=" + std::to_string(stats.misses.load()) +
                             " evictions=" + std::to_string(stats.evictions.load()) +
                             " expirations=" +
                             std::to_string(stats.expirations.load()));
                         if (ctx.has_flag("clear")) {
                             cache.invalidate_all();
                             ctx.reply_raw("Cache cleared.");
                         }
                     });
             })
        .sub("level", [](CommandSpec& s) {
            s.description("Change the log level")
                .arg("level")
                .executor([](CommandContext& ctx) {
                    const auto& name = ctx.arg<std::string>("level");
                    try {
                        log::Logger::set_level(
                            log::LogConfig::level_from_string(name));
                    } catch (const std::invalid_argument& e) {
                        ctx.reply_raw(e.what());
                        return false;
                    }
                    ctx.reply_raw("Log level set to " + name + ".");
                    return true;
                });
        });
    service_->register_command(CONSOLE_OWNER, spec);
}

bool ConsoleApp::handle_line(const std::string& raw, command::ICommandSender& sender,
                             std::ostream& out) {
    const auto line = boost::algorithm::trim_copy(raw);
    if (line.empty()) {
        return true;
    }
    if (line == "exit" || line == "quit") {
        return false;
    }
    if (line.front() == '?') {
        auto suggestions = service_->complete_line(sender, raw.substr(raw.find('?') + 1));
        out << (suggestions.empty() ? "(no suggestions)"
                                    : boost::algorithm::join(suggestions, "  "))
            << std::endl;
        return true;
    }
    const auto result = service_->dispatch_line(sender, line);
    SIGIL_LOG_DEBUG << "'" << line << "' -> " << command::to_string(result.status);
    return true;
}

int ConsoleApp::run(std::istream& in, std::ostream& out) {
    if (!started_) {
        start();
    }

    std::unique_ptr<StreamSender> sender;
    if (options_.player) {
        sender = std::make_unique<StreamSender>(*options_.player,
                                                command::SenderKind::PLAYER, out);
        for (const auto& permission : options_.permissions) {
            sender->grant(permission);
        }
    } else {
        sender = std::make_unique<StreamSender>("CONSOLE",
                                                command::SenderKind::CONSOLE, out);
    }

    for (const auto& line : options_.commands) {
        if (!handle_line(line, *sender, out)) {
            return 0;
        }
    }

    std::string line;
    while (true) {
        out << prompt_ << std::flush;
        if (!std::getline(in, line)) {
            out << std::endl;
            break;
        }
        if (!handle_line(line, *sender, out)) {
            break;
        }
    }
    return 0;
}

}  // namespace sigil::console

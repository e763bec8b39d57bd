#pragma once

#include <istream>
#include <memory>
#include <ostream>
#include <string>

#include "sigil/command/command_service.hpp"
#include "sigil/console/console_config.hpp"
#include "sigil/console/console_host.hpp"
#include "sigil/console/demo_commands.hpp"
#include "sigil/console/options.hpp"

namespace sigil::console {

inline constexpr const char* CONSOLE_OWNER = "console";

/**
 * @brief Line-oriented host for the command framework.
 *
 * Each input line is dispatched as a command; a line starting with '?'
 * prints completions for the rest of the line instead. "exit" and "quit"
 * end the session.
 */
class ConsoleApp {
public:
    explicit ConsoleApp(ConsoleOptions options);
    ~ConsoleApp();

    // Loads configuration, starts logging and registers commands
    void start();
    int run(std::istream& in, std::ostream& out);

    // Returns false once the session should end
    bool handle_line(const std::string& line, command::ICommandSender& sender,
                     std::ostream& out);

    command::CommandService& service() { return *service_; }

private:
    void load_configuration();
    void populate_directory(const ConsoleConfig& config);
    void register_admin_command();

    ConsoleOptions options_;
    std::shared_ptr<MemoryDirectory> directory_;
    std::shared_ptr<ConsoleBinder> binder_;
    std::unique_ptr<command::CommandService> service_;
    DemoState demo_;
    std::string prompt_ = "> ";
    bool started_ = false;
};

}  // namespace sigil::console

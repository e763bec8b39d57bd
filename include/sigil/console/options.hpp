#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sigil::console {

struct ConsoleOptions {
    bool show_help = false;
    std::string config_file;
    std::optional<std::string> log_level;
    // Act as this player instead of the console
    std::optional<std::string> player;
    std::vector<std::string> permissions;
    // Lines to run before reading stdin
    std::vector<std::string> commands;
};

class OptionsParser {
public:
    // Throws boost::program_options::error on malformed input
    static ConsoleOptions parse(int argc, char* argv[]);
    static std::string help_text();
};

}  // namespace sigil::console

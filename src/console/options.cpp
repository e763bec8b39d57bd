#include "sigil/console/options.hpp"

#include <boost/program_options.hpp>
#include <sstream>

#include "sigil/config/config.hpp"

namespace po = boost::program_options;

namespace sigil::console {

namespace {

po::options_description describe_options() {
    po::options_description desc("Options");
    desc.add_options()("help,h", "Show help message")(
        "config,c",
        po::value<std::string>()->default_value(
            config::ConfigPaths::DEFAULT_CONFIG_FILE),
        "Configuration file")("log-level,l", po::value<std::string>(),
                              "Override log.global_level")(
        "player,p", po::value<std::string>(),
        "Run commands as this online player")(
        "permission,P", po::value<std::vector<std::string>>()->composing(),
        "Grant a permission to the player (repeatable, '*' grants all)")(
        "execute,e", po::value<std::vector<std::string>>()->composing(),
        "Run a command line before reading input (repeatable)");
    return desc;
}

}  // namespace

ConsoleOptions OptionsParser::parse(int argc, char* argv[]) {
    ConsoleOptions options;
    const auto desc = describe_options();

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    options.show_help = vm.count("help") > 0;
    options.config_file = vm["config"].as<std::string>();
    if (vm.count("log-level")) {
        options.log_level = vm["log-level"].as<std::string>();
    }
    if (vm.count("player")) {
        options.player = vm["player"].as<std::string>();
    }
    if (vm.count("permission")) {
        options.permissions = vm["permission"].as<std::vector<std::string>>();
    }
    if (vm.count("execute")) {
        options.commands = vm["execute"].as<std::vector<std::string>>();
    }
    return options;
}

std::string OptionsParser::help_text() {
    std::ostringstream out;
    out << "sigil - interactive command console\n\n"
        << "Usage: sigil [options]\n\n"
        << describe_options() << "\n"
        << "Input lines are dispatched as commands. A line starting with '?'\n"
        << "prints completions for the rest of the line.\n";
    return out.str();
}

}  // namespace sigil::console

#include <boost/program_options/errors.hpp>
#include <iostream>

#include "sigil/console/console_app.hpp"
#include "sigil/console/options.hpp"

int main(int argc, char* argv[]) {
    sigil::console::ConsoleOptions options;
    try {
        options = sigil::console::OptionsParser::parse(argc, argv);
    } catch (const boost::program_options::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n"
                  << sigil::console::OptionsParser::help_text();
        return 1;
    }

    if (options.show_help) {
        std::cout << sigil::console::OptionsParser::help_text();
        return 0;
    }

    try {
        sigil::console::ConsoleApp app(std::move(options));
        return app.run(std::cin, std::cout);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

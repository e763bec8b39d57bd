#include <iostream>
#include <string>
#include <vector>

#include "sigil/command/argument_types.hpp"
#include "sigil/command/command_service.hpp"
#include "sigil/log/logger.hpp"

using namespace sigil::command;

enum class Color { RED, GREEN, BLUE };

// Sender that prints replies to stdout and holds every permission
class StdoutSender : public ICommandSender {
public:
    std::string name() const override { return "example"; }
    std::string id() const override { return "example"; }
    SenderKind kind() const override { return SenderKind::CONSOLE; }
    bool has_permission(const std::string&) const override { return true; }
    void send_message(const std::string& message) override {
        std::cout << "  << " << message << std::endl;
    }
};

int main() {
    sigil::log::LogConfig log_config;
    log_config.global_level = sigil::log::LogConfig::LogLevel::DEBUG;
    sigil::log::Logger::init(log_config);

    CommandService service;

    // A custom type scoped to the "painter" owner
    service.types().register_for_owner(
        "painter", "color",
        std::make_shared<EnumType<Color>>(
            "color", std::vector<std::pair<std::string, Color>>{
                         {"red", Color::RED},
                         {"green", Color::GREEN},
                         {"blue", Color::BLUE}}));

    auto paint = CommandSpec::root("paint");
    paint.aliases({"p"})
        .description("Paint a wall")
        .arg("color", "color")
        .arg("coats", "integer", "1")
        .flag("glossy", 'g')
        .executor([](CommandContext& ctx) {
            static const char* names[] = {"red", "green", "blue"};
            const auto color = ctx.arg<Color>("color");
            ctx.reply_raw("Painted " + std::to_string(ctx.arg<int>("coats")) +
                          " coat(s) of " +
                          (ctx.has_flag("glossy") ? "glossy " : "") +
                          names[static_cast<int>(color)] + ".");
        });
    service.register_command("painter", paint);

    StdoutSender sender;
    const std::vector<std::string> lines = {"paint blue", "p green 3 -g",
                                            "paint purple", "paint"};
    for (const auto& line : lines) {
        std::cout << ">> " << line << std::endl;
        const auto result = service.dispatch_line(sender, line);
        std::cout << "  status: " << to_string(result.status) << std::endl;
    }

    std::cout << ">> completions for 'paint g'" << std::endl;
    for (const auto& suggestion : service.complete_line(sender, "paint g")) {
        std::cout << "  " << suggestion << std::endl;
    }

    service.unregister_all("painter");
    sigil::log::Logger::shutdown();
    return 0;
}

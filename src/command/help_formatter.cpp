#include "sigil/command/help_formatter.hpp"

#include <algorithm>

namespace sigil::command {

std::vector<SubNodePtr> HelpFormatter::visible_children(
    const ICommandSender& sender, const CommandNode& node) {
    std::vector<SubNodePtr> visible;
    // children() is a std::map, already ordered by name
    for (const auto& [name, child] : node.children()) {
        const auto& permission = child->permission();
        if (!permission || sender.has_permission(*permission)) {
            visible.push_back(child);
        }
    }
    return visible;
}

size_t HelpFormatter::page_count(size_t entries, size_t page_size) {
    if (page_size == 0) {
        page_size = 1;
    }
    return std::max<size_t>(1, (entries + page_size - 1) / page_size);
}

void HelpFormatter::render(ICommandSender& sender, const std::string& owner,
                           const std::string& command_path,
                           const CommandNode& node, int page,
                           size_t page_size) const {
    const auto children = visible_children(sender, node);
    if (children.empty()) {
        if (node.is_executable()) {
            messages_.send(sender, owner, "commands.usage",
                           {{"usage", node.generate_usage(command_path)}});
        } else {
            messages_.send(sender, owner, "commands.help.empty");
        }
        return;
    }

    if (page_size == 0) {
        page_size = 1;
    }
    const auto pages = page_count(children.size(), page_size);
    const auto current = static_cast<size_t>(
        std::clamp<long long>(page, 1, static_cast<long long>(pages)));
    const std::string command = "/" + command_path;

    messages_.send(sender, owner, "commands.help.header",
                   {{"command", command},
                    {"page", std::to_string(current)},
                    {"pages", std::to_string(pages)}});

    const auto first = (current - 1) * page_size;
    const auto last = std::min(children.size(), first + page_size);
    for (auto i = first; i < last; ++i) {
        const auto& child = children[i];
        messages_.send(
            sender, owner, "commands.help.line",
            {{"usage", child->generate_usage(command_path + " " + child->name())},
             {"description", child->description()}});
    }

    if (pages > 1) {
        messages_.send(sender, owner, "commands.help.footer",
                       {{"command", command}});
    }
}

}  // namespace sigil::command

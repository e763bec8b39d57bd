#pragma once

#include <string>
#include <vector>

#include "sigil/command/command_node.hpp"
#include "sigil/command/message_catalog.hpp"
#include "sigil/command/sender.hpp"

namespace sigil::command {

// Paginated listing of a node's children, rendered through the catalog.
class HelpFormatter {
public:
    explicit HelpFormatter(const MessageCatalog& messages)
        : messages_(messages) {}

    // Children whose permission the sender holds, sorted by name
    static std::vector<SubNodePtr> visible_children(const ICommandSender& sender,
                                                    const CommandNode& node);

    static size_t page_count(size_t entries, size_t page_size);

    // `command_path` is the canonical path without the leading slash. Pages
    // are 1-based and clamped into range. A node with nothing to list shows
    // its usage when executable.
    void render(ICommandSender& sender, const std::string& owner,
                const std::string& command_path, const CommandNode& node,
                int page, size_t page_size) const;

private:
    const MessageCatalog& messages_;
};

}  // namespace sigil::command

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sigil/command/host.hpp"
#include "sigil/command/message_catalog.hpp"
#include "sigil/command/parsed_args.hpp"
#include "sigil/command/parsed_flags.hpp"
#include "sigil/command/sender.hpp"
#include "sigil/command/text.hpp"

namespace sigil::command {

// Everything a compiled executor sees for one invocation.
class CommandContext {
public:
    CommandContext(ICommandSender& sender, std::string owner, std::string label,
                   std::vector<std::string> path, ParsedArgs args,
                   ParsedFlags flags, const MessageCatalog& messages,
                   std::shared_ptr<const IHostDirectory> host = nullptr)
        : sender_(sender),
          owner_(std::move(owner)),
          label_(std::move(label)),
          path_(std::move(path)),
          args_(std::move(args)),
          flags_(std::move(flags)),
          messages_(messages),
          host_(std::move(host)) {}

    ICommandSender& sender() const { return sender_; }
    const std::string& owner() const { return owner_; }
    // Root label as the user typed it (may be an alias)
    const std::string& label() const { return label_; }
    const std::vector<std::string>& path() const { return path_; }
    std::string path_string() const { return text::join(path_, 0); }
    const ParsedArgs& args() const { return args_; }
    const ParsedFlags& flags() const { return flags_; }
    const MessageCatalog& messages() const { return messages_; }
    const std::shared_ptr<const IHostDirectory>& host() const { return host_; }
    bool is_player() const { return sender_.is_player(); }

    template <typename T>
    const T& arg(const std::string& name) const {
        return args_.get<T>(name);
    }

    template <typename T>
    std::optional<T> optional_arg(const std::string& name) const {
        return args_.get_optional<T>(name);
    }

    bool has_flag(const std::string& name) const { return flags_.has(name); }
    std::optional<std::string> flag_value(const std::string& name) const {
        return flags_.value(name);
    }

    void reply(const std::string& key, const Placeholders& placeholders = {}) {
        messages_.send(sender_, owner_, key, placeholders);
    }
    void reply_raw(const std::string& message) {
        sender_.send_message(message);
    }

private:
    ICommandSender& sender_;
    std::string owner_;
    std::string label_;
    std::vector<std::string> path_;
    ParsedArgs args_;
    ParsedFlags flags_;
    const MessageCatalog& messages_;
    std::shared_ptr<const IHostDirectory> host_;
};

}  // namespace sigil::command

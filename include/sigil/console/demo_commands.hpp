#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "sigil/command/command_context.hpp"
#include "sigil/command/command_service.hpp"
#include "sigil/command/host.hpp"

namespace sigil::console {

inline constexpr const char* DEMO_OWNER = "demo";

// Balances keyed by actor id; receiver of the reflective "eco" command
class Economy {
public:
    void show(command::CommandContext& ctx,
              std::optional<command::ActorRef> target);
    bool give(command::CommandContext& ctx, const command::ActorRef& target,
              int amount, bool silent);
    void pay(command::CommandContext& ctx, const command::ActorRef& target,
             double amount);
    void reset(command::CommandContext& ctx, const command::ActorRef& target);

    double balance_of(const std::string& actor_id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, double> balances_;
};

// Named locations; state behind the fluent "warp" command
class WarpBook {
public:
    bool set(const std::string& name, const std::string& world, bool overwrite);
    bool remove(const std::string& name);
    std::optional<std::string> world_of(const std::string& name) const;
    std::map<std::string, std::string> all() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> warps_;
};

struct DemoState {
    std::shared_ptr<Economy> economy = std::make_shared<Economy>();
    std::shared_ptr<WarpBook> warps = std::make_shared<WarpBook>();
};

// Registers "warp" (fluent), "eco" (reflective) and "msg" under DEMO_OWNER
DemoState register_demo_commands(command::CommandService& service);

}  // namespace sigil::console

#include "sigil/console/demo_commands.hpp"

#include <iomanip>
#include <sstream>

#include "sigil/command/argument_types.hpp"
#include "sigil/command/handler_definition.hpp"
#include "sigil/command/text.hpp"

namespace sigil::console {

using command::CommandContext;
using command::CommandSpec;

namespace {

std::string money(double amount) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << amount;
    return out.str();
}

void register_warp(command::CommandService& service,
                   const std::shared_ptr<WarpBook>& warps) {
    auto spec = CommandSpec::root("warp");
    spec.aliases({"w", "warps"})
        .description("Named locations")
        .permission("sigil.warp")
        .sub("set",
             [warps](CommandSpec& s) {
                 s.description("Create or move a warp")
                     .arg("name")
                     .arg("world", "world", "world")
                     .flag("force", 'f')
                     .executor([warps](CommandContext& ctx) {
                         const auto& name = ctx.arg<std::string>("name");
                         const auto& world = ctx.arg<command::WorldRef>("world");
                         if (!warps->set(name, world.name, ctx.has_flag("force"))) {
                             ctx.reply_raw("Warp " + name +
                                           " exists; use --force to move it.");
                             return;
                         }
                         ctx.reply_raw("Warp " + name + " set in " + world.name +
                                       ".");
                     });
             })
        .sub("delete",
             [warps](CommandSpec& s) {
                 s.aliases({"del", "remove"})
                     .description("Delete a warp")
                     .permission("sigil.warp.delete")
                     .arg("name")
                     .executor([warps](CommandContext& ctx) {
                         const auto& name = ctx.arg<std::string>("name");
                         ctx.reply_raw(warps->remove(name)
                                           ? "Warp " + name + " deleted."
                                           : "No warp named " + name + ".");
                     });
             })
        .sub("tp",
             [warps](CommandSpec& s) {
                 s.description("Teleport to a warp")
                     .player_only()
                     .arg("name")
                     .cooldown(std::chrono::seconds(5), "sigil.warp.nocooldown")
                     .executor([warps](CommandContext& ctx) {
                         const auto& name = ctx.arg<std::string>("name");
                         auto world = warps->world_of(name);
                         if (!world) {
                             ctx.reply_raw("No warp named " + name + ".");
                             return false;
                         }
                         ctx.reply_raw("Whoosh! " + ctx.sender().name() +
                                       " is now at " + name + " (" + *world +
                                       ").");
                         return true;
                     });
             })
        .arg("page", "integer", "1")
        .executor([warps](CommandContext& ctx) {
            const auto all = warps->all();
            if (all.empty()) {
                ctx.reply_raw("No warps yet.");
                return;
            }
            ctx.reply_raw("Warps (page " +
                          std::to_string(ctx.arg<int>("page")) + "):");
            for (const auto& [name, world] : all) {
                ctx.reply_raw(" " + name + " @ " + world);
            }
        });
    service.register_command(DEMO_OWNER, spec);
}

void register_msg(command::CommandService& service) {
    auto spec = CommandSpec::root("msg");
    spec.aliases({"tell", "whisper"})
        .description("Send a private message")
        .arg("target", "player")
        .arg("message", "greedyString")
        .executor([](CommandContext& ctx) {
            const auto& target = ctx.arg<command::ActorRef>("target");
            ctx.reply_raw("[" + ctx.sender().name() + " -> " + target.name +
                          "] " + ctx.arg<std::string>("message"));
        });
    service.register_command(DEMO_OWNER, spec);
}

void register_eco(command::CommandService& service,
                  const std::shared_ptr<Economy>& economy) {
    using namespace command::param;

    service.types().register_for_owner(
        DEMO_OWNER, "amount", std::make_shared<command::IntegerType>(1, 1000000));
    service.types().register_for_owner(
        DEMO_OWNER, "money", std::make_shared<command::DoubleType>(0.01, 1e9));

    command::HandlerDefinition<Economy> eco(economy, "eco");
    eco.aliases({"economy", "money"})
        .description("Balances")
        .permission("sigil.eco");
    eco.subcommand("default", &Economy::show,
                   {context(), arg("target").optional()})
        .description("Show a balance");
    eco.subcommand("give", &Economy::give,
                   {context(), arg("target"), arg("amount").type("amount"),
                    flag("silent", 's')})
        .description("Create money")
        .permission("sigil.eco.admin");
    eco.subcommand("pay", &Economy::pay,
                   {context(), arg("target"), arg("amount").type("money")})
        .description("Transfer money")
        .player_only()
        .cooldown(std::chrono::seconds(2), "", "eco.pay-cooldown");
    eco.subcommand("admin reset", &Economy::reset, {context(), arg("target")})
        .description("Clear a balance")
        .permission("sigil.eco.admin");

    service.messages().register_owner_messages(
        DEMO_OWNER,
        {{"eco.pay-cooldown", "Slow down! You can pay again in {remaining}."}});
    service.register_handler(DEMO_OWNER, eco);
}

}  // namespace

void Economy::show(CommandContext& ctx,
                   std::optional<command::ActorRef> target) {
    if (!target) {
        ctx.reply_raw("Your balance: " + money(balance_of(ctx.sender().id())));
        return;
    }
    ctx.reply_raw(target->name + "'s balance: " + money(balance_of(target->id)));
}

bool Economy::give(CommandContext& ctx, const command::ActorRef& target,
                   int amount, bool silent) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        balances_[target.id] += amount;
    }
    if (!silent) {
        ctx.reply_raw("Gave " + std::to_string(amount) + " to " + target.name +
                      ".");
    }
    return true;
}

void Economy::pay(CommandContext& ctx, const command::ActorRef& target,
                  double amount) {
    const auto from = ctx.sender().id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& balance = balances_[from];
        if (balance < amount) {
            ctx.reply_raw("Insufficient funds.");
            return;
        }
        balance -= amount;
        balances_[target.id] += amount;
    }
    ctx.reply_raw("Paid " + money(amount) + " to " + target.name + ".");
}

void Economy::reset(CommandContext& ctx, const command::ActorRef& target) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        balances_.erase(target.id);
    }
    ctx.reply_raw("Balance of " + target.name + " cleared.");
}

double Economy::balance_of(const std::string& actor_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(actor_id);
    return it == balances_.end() ? 0.0 : it->second;
}

bool WarpBook::set(const std::string& name, const std::string& world,
                   bool overwrite) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = command::text::to_lower(name);
    if (warps_.count(key) > 0 && !overwrite) {
        return false;
    }
    warps_[key] = world;
    return true;
}

bool WarpBook::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return warps_.erase(command::text::to_lower(name)) > 0;
}

std::optional<std::string> WarpBook::world_of(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = warps_.find(command::text::to_lower(name));
    if (it == warps_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, std::string> WarpBook::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warps_;
}

DemoState register_demo_commands(command::CommandService& service) {
    DemoState state;
    register_warp(service, state.warps);
    register_msg(service);
    register_eco(service, state.economy);
    return state;
}

}  // namespace sigil::console

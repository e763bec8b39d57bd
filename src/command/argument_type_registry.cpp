#include "sigil/command/argument_type_registry.hpp"

#include <mutex>

#include "sigil/command/argument_types.hpp"
#include "sigil/command/errors.hpp"
#include "sigil/command/text.hpp"
#include "sigil/log/logger.hpp"

namespace sigil::command {

ArgumentTypeRegistry::ArgumentTypeRegistry(
    std::shared_ptr<const IHostDirectory> directory) {
    register_builtin_types();
    if (directory) {
        attach_host(std::move(directory));
    }
}

void ArgumentTypeRegistry::register_builtin_types() {
    auto string_type = std::make_shared<StringType>();
    register_type("string", string_type);
    register_type("str", string_type);

    auto greedy = std::make_shared<GreedyStringType>();
    for (const char* name :
         {"greedyString", "greedy_string", "greedy", "text", "message"}) {
        register_type(name, greedy);
    }

    auto integer = std::make_shared<IntegerType>();
    register_type("integer", integer);
    register_type("int", integer);

    auto decimal = std::make_shared<DoubleType>();
    for (const char* name : {"double", "number", "decimal", "float"}) {
        register_type(name, decimal);
    }

    auto boolean = std::make_shared<BooleanType>();
    register_type("boolean", boolean);
    register_type("bool", boolean);
}

void ArgumentTypeRegistry::attach_host(
    std::shared_ptr<const IHostDirectory> directory) {
    auto online = std::make_shared<OnlineActorType>(directory);
    register_type("player", online);
    register_type("playerOnline", online);
    register_type("onlinePlayer", online);

    auto offline = std::make_shared<OfflineActorType>(directory);
    register_type("playerOffline", offline);
    register_type("offlinePlayer", offline);

    register_type("world", std::make_shared<WorldType>(directory));
}

void ArgumentTypeRegistry::register_type(const std::string& name,
                                         ArgumentTypePtr type) {
    if (name.empty() || !type) {
        throw CommandException("Argument type registration needs a name and "
                               "a type");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    global_[text::to_lower(name)] = std::move(type);
}

bool ArgumentTypeRegistry::unregister(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return global_.erase(text::to_lower(name)) > 0;
}

ArgumentTypePtr ArgumentTypeRegistry::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = global_.find(text::to_lower(name));
    return it == global_.end() ? nullptr : it->second;
}

bool ArgumentTypeRegistry::contains(const std::string& name) const {
    return get(name) != nullptr;
}

size_t ArgumentTypeRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return global_.size();
}

void ArgumentTypeRegistry::register_for_owner(const std::string& owner,
                                              const std::string& name,
                                              ArgumentTypePtr type) {
    if (owner.empty() || name.empty() || !type) {
        throw CommandException("Owner-scoped argument type registration needs "
                               "an owner, a name and a type");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    by_owner_[owner][text::to_lower(name)] = std::move(type);
    SIGIL_LOG_DEBUG << "Registered argument type '" << name << "' for owner "
                    << owner;
}

ArgumentTypePtr ArgumentTypeRegistry::get_for_owner(
    const std::string& owner, const std::string& name) const {
    const auto key = text::to_lower(name);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (auto scope = by_owner_.find(owner); scope != by_owner_.end()) {
        if (auto it = scope->second.find(key); it != scope->second.end()) {
            return it->second;
        }
    }
    auto it = global_.find(key);
    return it == global_.end() ? nullptr : it->second;
}

size_t ArgumentTypeRegistry::unregister_all_for_owner(
    const std::string& owner) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = by_owner_.find(owner);
    if (it == by_owner_.end()) {
        return 0;
    }
    const size_t removed = it->second.size();
    by_owner_.erase(it);
    return removed;
}

}  // namespace sigil::command

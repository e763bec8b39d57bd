#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sigil/command/argument_type.hpp"
#include "sigil/command/host.hpp"

namespace sigil::command {

/**
 * @brief Named argument types, global and owner-scoped.
 *
 * Names are case-insensitive. An owner-scoped type shadows a global type of
 * the same name for that owner's commands only. Built-in types are present
 * from construction; the actor and world types are added once a host
 * directory is supplied.
 */
class ArgumentTypeRegistry {
public:
    explicit ArgumentTypeRegistry(
        std::shared_ptr<const IHostDirectory> directory = nullptr);

    void register_type(const std::string& name, ArgumentTypePtr type);
    bool unregister(const std::string& name);
    ArgumentTypePtr get(const std::string& name) const;
    bool contains(const std::string& name) const;
    size_t size() const;

    void register_for_owner(const std::string& owner, const std::string& name,
                            ArgumentTypePtr type);
    // Owner scope first, then global; nullptr when neither knows the name
    ArgumentTypePtr get_for_owner(const std::string& owner,
                                  const std::string& name) const;
    size_t unregister_all_for_owner(const std::string& owner);

    void attach_host(std::shared_ptr<const IHostDirectory> directory);

private:
    void register_builtin_types();

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ArgumentTypePtr> global_;
    std::unordered_map<std::string,
                       std::unordered_map<std::string, ArgumentTypePtr>>
        by_owner_;
};

}  // namespace sigil::command

#pragma once

#include <string>

#include "sigil/command/argument_type_registry.hpp"
#include "sigil/command/command_node.hpp"
#include "sigil/command/command_spec.hpp"
#include "sigil/command/handler_definition.hpp"

namespace sigil::command {

/**
 * @brief Compiles declarations into immutable node trees.
 *
 * Both declaration styles end up here: a HandlerDefinition is first lowered
 * to a CommandSpec, then every level is validated and built bottom-up.
 * Malformed declarations throw ProcessingException; unknown argument type
 * names are only logged since the type may be registered later.
 */
class CommandProcessor {
public:
    explicit CommandProcessor(const ArgumentTypeRegistry& types)
        : types_(types) {}

    RootNodePtr compile(const std::string& owner, const CommandSpec& spec) const;
    RootNodePtr compile(const std::string& owner,
                        const HandlerDefinitionBase& definition) const {
        return compile(owner, definition.to_spec());
    }

private:
    SubNodePtr compile_child(const std::string& owner, const std::string& path,
                             const CommandSpec& spec) const;

    template <typename Builder>
    void apply_common(Builder& builder, const std::string& owner,
                      const std::string& path, const CommandSpec& spec) const;

    void check_types(const std::string& owner, const std::string& path,
                     const CommandSpec& spec) const;

    const ArgumentTypeRegistry& types_;
};

}  // namespace sigil::command

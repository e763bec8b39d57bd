#pragma once

#include "sigil/command/command_node.hpp"

namespace sigil::command {

// Host side of registration: wires roots into the runtime command table.
class IHostBinder {
public:
    virtual ~IHostBinder() = default;

    virtual void bind(const RootNodePtr& root) = 0;
    virtual void unbind(const RootNodePtr& root) = 0;
    // Called once after a batch of bind/unbind calls
    virtual void sync() {}
};

}  // namespace sigil::command

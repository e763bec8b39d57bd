#include "sigil/console/console_config.hpp"

#include <stdexcept>

namespace sigil::console {

void ConsoleConfig::from_ptree(const boost::property_tree::ptree& pt) {
    if (pt.get_child_optional("actors")) {
        load_vector(pt, "actors", actors);
    }
    if (pt.get_child_optional("offline_actors")) {
        load_vector(pt, "offline_actors", offline_actors);
    }
    if (pt.get_child_optional("worlds")) {
        load_vector(pt, "worlds", worlds);
    }
    prompt = get_value(pt, "prompt", prompt);
}

void ConsoleConfig::validate() const {
    for (const auto& name : actors) {
        if (name.empty()) {
            throw std::invalid_argument("console.actors cannot contain empty names");
        }
    }
    for (const auto& name : worlds) {
        if (name.empty()) {
            throw std::invalid_argument("console.worlds cannot contain empty names");
        }
    }
}

}  // namespace sigil::console

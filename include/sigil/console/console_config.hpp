#pragma once

#include <string>
#include <vector>

#include "sigil/config/config.hpp"

namespace sigil::console {

// Simulated host contents, bound to the "console" section
class ConsoleConfig : public config::ClonableConfigurationProperties<ConsoleConfig> {
public:
    // Online actor names
    std::vector<std::string> actors = {"Steve", "Alex"};
    // Actors known to the host but currently offline
    std::vector<std::string> offline_actors;
    std::vector<std::string> worlds = {"world", "world_nether", "world_the_end"};
    std::string prompt = "> ";

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "console"; }
};

}  // namespace sigil::console

#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "sigil/config/config.hpp"

namespace sigil::command {

// Tuning and message overrides, bound to the "commands" section
class CommandConfig
    : public config::ReloadableConfigurationProperties<CommandConfig> {
public:
    struct CompletionConfig {
        int64_t ttl_ms = 2000;
        size_t max_entries = 1000;
        size_t max_suggestions = 50;
        size_t partial_key_length = 10;
        int64_t slow_threshold_us = 1000;
    };

    struct DispatchConfig {
        int64_t slow_threshold_us = 500;
    };

    bool debug = false;
    CompletionConfig completion;
    DispatchConfig dispatch;
    size_t help_page_size = 8;
    size_t cooldown_purge_threshold = 4096;
    // Flattened "messages" subtree: nested keys joined with '.'
    std::map<std::string, std::string> messages;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "commands"; }
};

}  // namespace sigil::command

#include "sigil/command/command_config.hpp"

#include <stdexcept>

namespace sigil::command {

namespace {

void flatten(const boost::property_tree::ptree& pt, const std::string& prefix,
             std::map<std::string, std::string>& out) {
    for (const auto& [key, child] : pt) {
        const auto path = prefix.empty() ? key : prefix + "." + key;
        if (child.empty()) {
            out[path] = child.get_value<std::string>();
        } else {
            flatten(child, path, out);
        }
    }
}

}  // namespace

void CommandConfig::from_ptree(const boost::property_tree::ptree& pt) {
    debug = get_value(pt, "debug", debug);

    if (auto completion_pt = pt.get_child_optional("completion")) {
        completion.ttl_ms = get_value(*completion_pt, "ttl_ms", completion.ttl_ms);
        completion.max_entries =
            get_value(*completion_pt, "max_entries", completion.max_entries);
        completion.max_suggestions = get_value(
            *completion_pt, "max_suggestions", completion.max_suggestions);
        completion.partial_key_length = get_value(
            *completion_pt, "partial_key_length", completion.partial_key_length);
        completion.slow_threshold_us = get_value(
            *completion_pt, "slow_threshold_us", completion.slow_threshold_us);
    }

    if (auto dispatch_pt = pt.get_child_optional("dispatch")) {
        dispatch.slow_threshold_us =
            get_value(*dispatch_pt, "slow_threshold_us", dispatch.slow_threshold_us);
    }

    help_page_size = get_value(pt, "help.page_size", help_page_size);
    cooldown_purge_threshold =
        get_value(pt, "cooldown.purge_threshold", cooldown_purge_threshold);

    messages.clear();
    if (auto messages_pt = pt.get_child_optional("messages")) {
        flatten(*messages_pt, "", messages);
    }
}

void CommandConfig::validate() const {
    if (completion.ttl_ms <= 0) {
        throw std::invalid_argument("completion.ttl_ms must be greater than 0");
    }
    if (completion.max_entries == 0) {
        throw std::invalid_argument(
            "completion.max_entries must be greater than 0");
    }
    if (completion.max_suggestions == 0) {
        throw std::invalid_argument(
            "completion.max_suggestions must be greater than 0");
    }
    if (completion.partial_key_length == 0) {
        throw std::invalid_argument(
            "completion.partial_key_length must be greater than 0");
    }
    if (help_page_size == 0) {
        throw std::invalid_argument("help.page_size must be greater than 0");
    }
    if (cooldown_purge_threshold == 0) {
        throw std::invalid_argument(
            "cooldown.purge_threshold must be greater than 0");
    }
    if (completion.slow_threshold_us < 0 || dispatch.slow_threshold_us < 0) {
        throw std::invalid_argument("slow thresholds cannot be negative");
    }
}

}  // namespace sigil::command

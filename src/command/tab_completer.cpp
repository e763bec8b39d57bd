#include "sigil/command/tab_completer.hpp"

#include <algorithm>

#include "sigil/command/flag_parser.hpp"
#include "sigil/command/text.hpp"
#include "sigil/command/tokenizer.hpp"
#include "sigil/log/logger.hpp"

namespace sigil::command {

namespace {

bool visible_to(const ICommandSender& sender, const CommandNode& node) {
    const auto& permission = node.permission();
    return !permission || sender.has_permission(*permission);
}

// Every node from the root down to the resolved one must be visible
bool path_visible_to(const ICommandSender& sender, const Resolution& resolution) {
    for (const auto& step : resolution.chain()) {
        if (!visible_to(sender, *step)) {
            return false;
        }
    }
    return true;
}

// True when the token before the cursor is a flag still waiting for its value
bool awaiting_flag_value(const CommandNode& node,
                         const std::vector<std::string>& typed) {
    if (typed.empty()) {
        return false;
    }
    const auto& last = typed.back();
    if (last.size() < 2 || last[0] != '-' || text::is_numeric(last) ||
        last.find('=') != std::string::npos) {
        return false;
    }
    for (const auto& flag : node.flags()) {
        if (!flag.has_value) {
            continue;
        }
        if (last.rfind("--", 0) == 0) {
            if (text::to_lower(last.substr(2)) == text::to_lower(flag.name)) {
                return true;
            }
        } else if (flag.short_name &&
                   text::to_lower(std::string(1, last.back())) ==
                       text::to_lower(std::string(1, *flag.short_name))) {
            return true;
        }
    }
    return false;
}

}  // namespace

TabCompleter::TabCompleter(const CommandGraph& graph,
                           const ArgumentTypeRegistry& types,
                           CompletionCache& cache)
    : graph_(graph), parser_(types), cache_(cache) {}

void TabCompleter::configure(const CompleterSettings& settings) {
    max_suggestions_ = settings.max_suggestions;
    partial_key_length_ = settings.partial_key_length;
    slow_threshold_us_ = settings.slow_threshold.count();
    debug_ = settings.debug;
}

std::vector<std::string> TabCompleter::complete_line(
    const ICommandSender& sender, const std::string& line) const {
    const auto parts = split_command_line(line);
    if (!parts.has_rest) {
        return complete_labels(sender, parts.label);
    }
    return complete(sender, parts.label, {parts.rest});
}

std::vector<std::string> TabCompleter::complete(
    const ICommandSender& sender, const std::string& label,
    const std::vector<std::string>& args) const {
    if (args.empty()) {
        return {};
    }
    const auto started = std::chrono::steady_clock::now();

    const auto tokens = retokenize(args, true);
    if (tokens.empty()) {
        return {};
    }
    std::vector<std::string> path{label};
    path.insert(path.end(), tokens.begin(), tokens.end() - 1);
    const auto resolution = graph_.resolve(path);

    std::vector<std::string> result;
    if (resolution.found() && path_visible_to(sender, resolution)) {
        result = finish(collect(sender, resolution, tokens.back()),
                        tokens.back());
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);
    if (debug_ && elapsed.count() > slow_threshold_us_) {
        SIGIL_LOG_WARN << "Slow tab completion for '" << label
                       << "': " << elapsed.count() << "us";
    }
    return result;
}

std::vector<std::string> TabCompleter::collect(const ICommandSender& sender,
                                               const Resolution& resolution,
                                               const std::string& partial) const {
    const auto& node = *resolution.node;
    std::vector<std::string> candidates;

    if (partial.rfind("--", 0) == 0) {
        candidates.push_back("--help");
        for (const auto& flag : node.flags()) {
            candidates.push_back("--" + text::to_lower(flag.name));
        }
        return candidates;
    }
    if (partial.size() > 1 && partial[0] == '-' && !text::is_numeric(partial)) {
        candidates.push_back("-h");
        for (const auto& flag : node.flags()) {
            if (flag.short_name) {
                candidates.push_back(
                    "-" + text::to_lower(std::string(1, *flag.short_name)));
            }
        }
        return candidates;
    }

    // Children only while no argument has been typed at this level
    if (resolution.remaining.empty()) {
        for (const auto& [name, child] : node.children()) {
            if (!visible_to(sender, *child)) {
                continue;
            }
            candidates.push_back(name);
            candidates.insert(candidates.end(), child->aliases().begin(),
                              child->aliases().end());
        }
        if (node.has_children()) {
            candidates.push_back("help");
        }
    }

    if (node.is_executable() && !node.arguments().empty()) {
        auto arguments = complete_arguments(sender, resolution, partial);
        candidates.insert(candidates.end(), arguments.begin(), arguments.end());
    }
    return candidates;
}

std::vector<std::string> TabCompleter::complete_labels(
    const ICommandSender& sender, const std::string& partial) const {
    std::vector<std::string> candidates;
    for (const auto& label : graph_.labels()) {
        auto root = graph_.get_root(label);
        if (root && visible_to(sender, *root)) {
            candidates.push_back(label);
        }
    }
    return finish(std::move(candidates), partial);
}

std::vector<std::string> TabCompleter::complete_arguments(
    const ICommandSender& sender, const Resolution& resolution,
    const std::string& partial) const {
    const auto& node = *resolution.node;
    if (awaiting_flag_value(node, resolution.remaining)) {
        return {};
    }

    auto positional = FlagParser(node.flags()).parse(resolution.remaining).remaining;
    const auto& specs = node.arguments();
    const auto& owner = resolution.root->owner();
    auto last_type = parser_.resolve_type(owner, specs.back().type_name);
    const int position = ArgumentParser::cursor_position(
        positional.size() + 1, specs, last_type && last_type->is_greedy());
    if (position < 0) {
        return {};
    }
    const auto& type_name = specs[static_cast<size_t>(position)].type_name;

    // Suggestions are computed for the truncated partial so every longer
    // partial sharing the key sees a superset; finish() narrows it down.
    auto key_partial = text::to_lower(partial);
    if (key_partial.size() > partial_key_length_) {
        key_partial.resize(partial_key_length_);
    }
    const std::string key = resolution.path_string() + ":" +
                            std::to_string(position) + ":" +
                            text::to_lower(type_name) + ":" + key_partial +
                            "@" + sender.id();

    positional.push_back(key_partial);
    auto suggestions = cache_.get(key, [&]() {
        return parser_.suggest(sender, owner, positional, specs);
    });
    if (!suggestions) {
        return {};
    }
    return *suggestions;
}

std::vector<std::string> TabCompleter::finish(std::vector<std::string> candidates,
                                              const std::string& partial) const {
    std::vector<std::string> result;
    for (auto& candidate : candidates) {
        if (!text::starts_with_ignore_case(candidate, partial)) {
            continue;
        }
        if (std::find(result.begin(), result.end(), candidate) == result.end()) {
            result.push_back(std::move(candidate));
        }
    }
    std::stable_sort(result.begin(), result.end(), text::less_ignore_case);
    if (result.size() > max_suggestions_) {
        result.resize(max_suggestions_);
    }
    return result;
}

}  // namespace sigil::command

#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#include "sigil/command/argument_parser.hpp"
#include "sigil/command/argument_type_registry.hpp"
#include "sigil/command/command_graph.hpp"
#include "sigil/command/completion_cache.hpp"
#include "sigil/command/sender.hpp"

namespace sigil::command {

struct CompleterSettings {
    size_t max_suggestions = 50;
    size_t partial_key_length = 10;
    std::chrono::microseconds slow_threshold{1000};
    bool debug = false;
};

/**
 * @brief Suggestions for partially typed input.
 *
 * The last token is the word being completed; everything before it resolves
 * the node. Results are deduplicated, prefix-filtered and sorted without
 * regard to case, then capped. Argument suggestions go through the
 * completion cache, keyed by node path, cursor position, type, truncated
 * partial and sender.
 */
class TabCompleter {
public:
    TabCompleter(const CommandGraph& graph, const ArgumentTypeRegistry& types,
                 CompletionCache& cache);

    // `args` are the tokens after the label, the last one in progress
    std::vector<std::string> complete(const ICommandSender& sender,
                                      const std::string& label,
                                      const std::vector<std::string>& args) const;
    // Whole input line; a line without whitespace completes root labels
    std::vector<std::string> complete_line(const ICommandSender& sender,
                                           const std::string& line) const;

    void configure(const CompleterSettings& settings);

private:
    std::vector<std::string> collect(const ICommandSender& sender,
                                     const Resolution& resolution,
                                     const std::string& partial) const;
    std::vector<std::string> complete_labels(const ICommandSender& sender,
                                             const std::string& partial) const;
    std::vector<std::string> complete_arguments(
        const ICommandSender& sender, const Resolution& resolution,
        const std::string& partial) const;
    std::vector<std::string> finish(std::vector<std::string> candidates,
                                    const std::string& partial) const;

    const CommandGraph& graph_;
    ArgumentParser parser_;
    CompletionCache& cache_;

    std::atomic<size_t> max_suggestions_{50};
    std::atomic<size_t> partial_key_length_{10};
    std::atomic<int64_t> slow_threshold_us_{1000};
    std::atomic<bool> debug_{false};
};

}  // namespace sigil::command

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sigil::command {

struct CompletionCacheStatistics {
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> evictions{0};
    std::atomic<uint64_t> expirations{0};

    double hit_ratio() const {
        const auto h = hits.load();
        const auto total = h + misses.load();
        return total == 0 ? 0.0 : static_cast<double>(h) / total;
    }

    void reset() {
        hits = 0;
        misses = 0;
        evictions = 0;
        expirations = 0;
    }
};

/**
 * @brief Size and TTL bounded LRU of suggestion lists.
 *
 * Entries are immutable once stored. Empty results are never cached so a
 * source that was momentarily empty is asked again on the next request.
 */
class CompletionCache {
public:
    using Suggestions = std::shared_ptr<const std::vector<std::string>>;
    using Supplier = std::function<std::vector<std::string>()>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit CompletionCache(
        std::chrono::milliseconds ttl = std::chrono::milliseconds(2000),
        size_t max_entries = 1000,
        Clock clock = &std::chrono::steady_clock::now);

    // Cached value, or the supplier's result (stored when non-empty). The
    // supplier runs without the cache lock held.
    Suggestions get(const std::string& key, const Supplier& supplier);
    Suggestions peek(const std::string& key);
    void put(const std::string& key, std::vector<std::string> suggestions);

    bool invalidate(const std::string& key);
    size_t invalidate_prefix(const std::string& prefix);
    void invalidate_all();
    size_t purge_expired();

    void reconfigure(std::chrono::milliseconds ttl, size_t max_entries);
    size_t size() const;
    const CompletionCacheStatistics& statistics() const { return stats_; }

private:
    struct Entry {
        std::string key;
        Suggestions value;
        std::chrono::steady_clock::time_point expires_at;
    };
    using EntryList = std::list<Entry>;

    void evict_overflow_locked();

    mutable std::mutex mutex_;
    EntryList lru_;
    std::unordered_map<std::string, EntryList::iterator> index_;
    std::chrono::milliseconds ttl_;
    size_t max_entries_;
    Clock clock_;
    CompletionCacheStatistics stats_;
};

}  // namespace sigil::command

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace sigil::command {

/**
 * @brief Process-local cooldown windows keyed by sender and command path.
 *
 * Each key owns an atomic expiry timestamp. try_acquire() starts a window
 * with compare-and-swap, so two concurrent callers can never both pass the
 * check for the same key.
 */
class CooldownTracker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit CooldownTracker(size_t purge_threshold = 4096,
                             Clock clock = &std::chrono::steady_clock::now);

    static std::string make_key(const std::string& sender_id,
                                const std::string& command_path) {
        return sender_id + ":command:" + command_path;
    }

    // Starts a window and returns nullopt, or returns the time left on the
    // active window
    std::optional<std::chrono::milliseconds> try_acquire(
        const std::string& key, std::chrono::milliseconds duration);

    std::chrono::milliseconds remaining(const std::string& key) const;
    bool reset(const std::string& key);
    size_t purge_expired();
    void clear();
    size_t size() const;

    void set_purge_threshold(size_t threshold) {
        purge_threshold_.store(threshold, std::memory_order_relaxed);
    }

private:
    using Expiry = std::atomic<int64_t>;
    static constexpr int64_t TOMBSTONE = INT64_MIN;

    int64_t now_ms() const;
    std::shared_ptr<Expiry> find(const std::string& key) const;
    std::shared_ptr<Expiry> find_or_create(const std::string& key);
    size_t purge_locked(int64_t now);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Expiry>> entries_;
    std::atomic<size_t> purge_threshold_;
    Clock clock_;
};

}  // namespace sigil::command

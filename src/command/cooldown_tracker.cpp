#include "sigil/command/cooldown_tracker.hpp"

#include <mutex>

#include "sigil/log/logger.hpp"

namespace sigil::command {

CooldownTracker::CooldownTracker(size_t purge_threshold, Clock clock)
    : purge_threshold_(purge_threshold), clock_(std::move(clock)) {}

int64_t CooldownTracker::now_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               clock_().time_since_epoch())
        .count();
}

std::shared_ptr<CooldownTracker::Expiry> CooldownTracker::find(
    const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<CooldownTracker::Expiry> CooldownTracker::find_or_create(
    const std::string& key) {
    if (auto existing = find(key)) {
        return existing;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (auto it = entries_.find(key); it != entries_.end()) {
        return it->second;
    }
    // Purge before inserting; a fresh entry reads as expired until acquired
    if (entries_.size() >= purge_threshold_.load(std::memory_order_relaxed)) {
        const size_t purged = purge_locked(now_ms());
        if (purged > 0) {
            SIGIL_LOG_DEBUG << "Purged " << purged
                            << " expired cooldown entries";
        }
    }
    auto entry = std::make_shared<Expiry>(0);
    entries_.emplace(key, entry);
    return entry;
}

std::optional<std::chrono::milliseconds> CooldownTracker::try_acquire(
    const std::string& key, std::chrono::milliseconds duration) {
    while (true) {
        auto entry = find_or_create(key);
        const int64_t now = now_ms();
        int64_t current = entry->load(std::memory_order_acquire);
        while (current != TOMBSTONE) {
            if (current > now) {
                return std::chrono::milliseconds(current - now);
            }
            if (entry->compare_exchange_weak(current, now + duration.count(),
                                             std::memory_order_acq_rel)) {
                return std::nullopt;
            }
        }
        // The entry was purged under us; look it up again
    }
}

std::chrono::milliseconds CooldownTracker::remaining(
    const std::string& key) const {
    auto entry = find(key);
    if (!entry) {
        return std::chrono::milliseconds(0);
    }
    const int64_t expiry = entry->load(std::memory_order_acquire);
    const int64_t now = now_ms();
    return std::chrono::milliseconds(expiry > now ? expiry - now : 0);
}

bool CooldownTracker::reset(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    it->second->store(TOMBSTONE, std::memory_order_release);
    entries_.erase(it);
    return true;
}

size_t CooldownTracker::purge_locked(int64_t now) {
    size_t purged = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        int64_t current = it->second->load(std::memory_order_acquire);
        // Tombstone first so a caller holding this entry retries the lookup
        if (current <= now &&
            it->second->compare_exchange_strong(current, TOMBSTONE,
                                                std::memory_order_acq_rel)) {
            it = entries_.erase(it);
            ++purged;
        } else {
            ++it;
        }
    }
    return purged;
}

size_t CooldownTracker::purge_expired() {
    const int64_t now = now_ms();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const size_t purged = purge_locked(now);
    if (purged > 0) {
        SIGIL_LOG_DEBUG << "Purged " << purged << " expired cooldown entries";
    }
    return purged;
}

void CooldownTracker::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& [key, entry] : entries_) {
        entry->store(TOMBSTONE, std::memory_order_release);
    }
    entries_.clear();
}

size_t CooldownTracker::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace sigil::command

#include "sigil/command/completion_cache.hpp"

namespace sigil::command {

CompletionCache::CompletionCache(std::chrono::milliseconds ttl,
                                 size_t max_entries, Clock clock)
    : ttl_(ttl), max_entries_(max_entries), clock_(std::move(clock)) {}

CompletionCache::Suggestions CompletionCache::peek(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    if (it->second->expires_at <= clock_()) {
        lru_.erase(it->second);
        index_.erase(it);
        ++stats_.expirations;
        return nullptr;
    }
    // Move to front
    lru_.splice(lru_.begin(), lru_, it->second);
    return it->second->value;
}

CompletionCache::Suggestions CompletionCache::get(const std::string& key,
                                                  const Supplier& supplier) {
    if (auto cached = peek(key)) {
        ++stats_.hits;
        return cached;
    }
    ++stats_.misses;

    auto computed =
        std::make_shared<const std::vector<std::string>>(supplier());
    if (!computed->empty()) {
        put(key, *computed);
    }
    return computed;
}

void CompletionCache::put(const std::string& key,
                          std::vector<std::string> suggestions) {
    if (suggestions.empty()) {
        return;
    }
    auto value =
        std::make_shared<const std::vector<std::string>>(std::move(suggestions));

    std::lock_guard<std::mutex> lock(mutex_);
    const auto expires_at = clock_() + ttl_;
    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->value = std::move(value);
        it->second->expires_at = expires_at;
        lru_.splice(lru_.begin(), lru_, it->second);
        return;
    }
    lru_.push_front(Entry{key, std::move(value), expires_at});
    index_[key] = lru_.begin();
    evict_overflow_locked();
}

void CompletionCache::evict_overflow_locked() {
    while (lru_.size() > max_entries_ && !lru_.empty()) {
        index_.erase(lru_.back().key);
        lru_.pop_back();
        ++stats_.evictions;
    }
}

bool CompletionCache::invalidate(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    lru_.erase(it->second);
    index_.erase(it);
    return true;
}

size_t CompletionCache::invalidate_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = lru_.begin(); it != lru_.end();) {
        if (it->key.rfind(prefix, 0) == 0) {
            index_.erase(it->key);
            it = lru_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void CompletionCache::invalidate_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    index_.clear();
}

size_t CompletionCache::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    size_t removed = 0;
    for (auto it = lru_.begin(); it != lru_.end();) {
        if (it->expires_at <= now) {
            index_.erase(it->key);
            it = lru_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    stats_.expirations += removed;
    return removed;
}

void CompletionCache::reconfigure(std::chrono::milliseconds ttl,
                                  size_t max_entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    ttl_ = ttl;
    max_entries_ = max_entries;
    evict_overflow_locked();
}

size_t CompletionCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

}  // namespace sigil::command

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace fedtrust::federation {

using Clock = std::chrono::steady_clock;

template<typename T>
struct CacheEntry {
    T value;
    Clock::time_point expires_at;
    
    bool is_expired(Clock::time_point now) const { return now >= expires_at; }
};

// Map of values with per-entry expiry. Readers share the lock; misses,
// replacements and sweeps take it exclusively.
template<typename K, typename V>
class TtlCache {
public:
    std::optional<V> get(const K& key, Clock::time_point now = Clock::now()) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end() || it->second.is_expired(now)) {
            return std::nullopt;
        }
        return it->second.value;
    }
    
    void put(const K& key, V value, Clock::duration ttl, Clock::time_point now = Clock::now()) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.insert_or_assign(key, CacheEntry<V>{std::move(value), now + ttl});
    }
    
    bool erase(const K& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return entries_.erase(key) > 0;
    }
    
    size_t prune_expired(Clock::time_point now = Clock::now()) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.is_expired(now)) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }
    
    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }
    
    void clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, CacheEntry<V>> entries_;
};

}

#include "fedtrust/storage/memory_key_cache_store.hpp"
#include <mutex>

namespace fedtrust::storage {

std::optional<CachedServerKey> MemoryKeyCacheStore::get(const std::string& server_name, const std::string& key_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = remote_keys_.find({server_name, key_id});
    if (it == remote_keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryKeyCacheStore::put(const std::string& server_name,
                              const std::string& key_id,
                              const std::string& public_key,
                              TimePoint fetched_at,
                              TimePoint expires_at) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    remote_keys_[{server_name, key_id}] = CachedServerKey{public_key, fetched_at, expires_at};
    return true;
}

std::optional<ServerSigningKey> MemoryKeyCacheStore::get_local_key(const std::string& server_name) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = local_keys_.find(server_name);
    if (it == local_keys_.end()) {
        return std::nullopt;
    }
    
    for (const auto& key : it->second) {
        if (key.is_active) {
            return key;
        }
    }
    return std::nullopt;
}

bool MemoryKeyCacheStore::put_local_key(const ServerSigningKey& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& keys = local_keys_[key.server_name];
    
    bool replaced = false;
    for (auto& existing : keys) {
        if (key.is_active) {
            existing.is_active = false;
        }
        if (existing.key_id == key.key_id) {
            existing = key;
            replaced = true;
        }
    }
    
    if (!replaced) {
        keys.push_back(key);
    }
    return true;
}

size_t MemoryKeyCacheStore::prune_expired(TimePoint now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = remote_keys_.begin(); it != remote_keys_.end();) {
        if (it->second.expires_at <= now) {
            it = remote_keys_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t MemoryKeyCacheStore::remote_key_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return remote_keys_.size();
}

}

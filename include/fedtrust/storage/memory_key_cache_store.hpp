#pragma once

#include "fedtrust/storage/key_cache_store.hpp"
#include <map>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace fedtrust::storage {

class MemoryKeyCacheStore : public KeyCacheStore {
public:
    std::optional<CachedServerKey> get(const std::string& server_name, const std::string& key_id) override;
    
    bool put(const std::string& server_name,
             const std::string& key_id,
             const std::string& public_key,
             TimePoint fetched_at,
             TimePoint expires_at) override;
    
    std::optional<ServerSigningKey> get_local_key(const std::string& server_name) override;
    bool put_local_key(const ServerSigningKey& key) override;
    
    size_t prune_expired(TimePoint now) override;
    
    size_t remote_key_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::pair<std::string, std::string>, CachedServerKey> remote_keys_;
    std::map<std::string, std::vector<ServerSigningKey>> local_keys_;
};

}

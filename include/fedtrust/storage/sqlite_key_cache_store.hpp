#pragma once

#include "fedtrust/storage/key_cache_store.hpp"
#include <filesystem>
#include <mutex>

struct sqlite3;

namespace fedtrust::storage {

class SqliteKeyCacheStore : public KeyCacheStore {
public:
    explicit SqliteKeyCacheStore(const std::filesystem::path& db_path);
    ~SqliteKeyCacheStore();
    
    SqliteKeyCacheStore(const SqliteKeyCacheStore&) = delete;
    SqliteKeyCacheStore& operator=(const SqliteKeyCacheStore&) = delete;
    
    bool initialize();
    
    std::optional<CachedServerKey> get(const std::string& server_name, const std::string& key_id) override;
    
    bool put(const std::string& server_name,
             const std::string& key_id,
             const std::string& public_key,
             TimePoint fetched_at,
             TimePoint expires_at) override;
    
    std::optional<ServerSigningKey> get_local_key(const std::string& server_name) override;
    bool put_local_key(const ServerSigningKey& key) override;
    
    size_t prune_expired(TimePoint now) override;

private:
    bool create_tables();
    bool exec(const char* sql);
    
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex mutex_;
};

}

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace fedtrust::storage {

using TimePoint = std::chrono::system_clock::time_point;

// A server's signing key. private_key (base64 Ed25519 seed) is only ever
// present for this server's own keys.
struct ServerSigningKey {
    std::string key_id;
    std::string server_name;
    std::optional<std::string> private_key;
    std::string public_key;
    TimePoint created_at{};
    std::optional<TimePoint> expires_at;
    bool is_active = true;
};

struct CachedServerKey {
    std::string public_key;
    TimePoint fetched_at{};
    TimePoint expires_at{};
};

// Narrow persistence interface for local signing keys and the remote key
// cache. Implementations must be safe to call from several threads.
class KeyCacheStore {
public:
    virtual ~KeyCacheStore() = default;
    
    // Returns the stored entry even when it has expired
    virtual std::optional<CachedServerKey> get(const std::string& server_name, const std::string& key_id) = 0;
    
    virtual bool put(const std::string& server_name,
                     const std::string& key_id,
                     const std::string& public_key,
                     TimePoint fetched_at,
                     TimePoint expires_at) = 0;
    
    // The active local key for server_name, if one was ever minted
    virtual std::optional<ServerSigningKey> get_local_key(const std::string& server_name) = 0;
    
    // Storing an active key deactivates any other key of the same server
    virtual bool put_local_key(const ServerSigningKey& key) = 0;
    
    virtual size_t prune_expired(TimePoint now) = 0;
};

}

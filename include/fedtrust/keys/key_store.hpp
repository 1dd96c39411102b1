#pragma once

#include "fedtrust/federation/federation_error.hpp"
#include "fedtrust/federation/http_client.hpp"
#include "fedtrust/federation/server_resolver.hpp"
#include "fedtrust/federation/ttl_cache.hpp"
#include "fedtrust/json/canonical_json.hpp"
#include "fedtrust/keys/key_provider.hpp"
#include "fedtrust/keys/verify_key_bundle.hpp"
#include "fedtrust/storage/key_cache_store.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace fedtrust::core {
class Config;
}

namespace fedtrust::keys {

struct KeyStoreConfig {
    std::string key_id = "ed25519:auto";
    std::chrono::milliseconds max_validity = std::chrono::hours(24 * 7);
    std::chrono::milliseconds local_validity = std::chrono::hours(24 * 7);
    federation::Clock::duration negative_cache_ttl = std::chrono::minutes(10);
    std::chrono::milliseconds timeout{10000};
    
    static KeyStoreConfig from_config(const core::Config& config);
};

struct PublicKeyOutcome {
    federation::FederationResult result;
    std::string public_key;
};

// Remote keys are fetched from /_matrix/key/v2/server, trusted only if the
// bundle is self-signed by the server it names, and cached for half of
// their remaining (capped) validity. The local key is minted on first use.
class KeyStore : public PublicKeyProvider, public LocalKeyProvider {
public:
    using SystemClock = std::chrono::system_clock;
    
    KeyStore(
        std::shared_ptr<storage::KeyCacheStore> store,
        std::shared_ptr<federation::ServerResolver> resolver,
        std::shared_ptr<federation::HttpClient> http_client,
        KeyStoreConfig config = {}
    );
    
    federation::FederationResult get_server_public_key(
        const std::string& server_name,
        const std::string& key_id,
        std::string& out_public_key
    ) override;
    
    std::future<PublicKeyOutcome> get_server_public_key_async(
        const std::string& server_name,
        const std::string& key_id
    );
    
    federation::FederationResult get_server_signing_key(
        const std::string& server_name,
        storage::ServerSigningKey& out_key
    ) override;
    
    // Fetches and verifies a server's bundle, caching its keys
    federation::FederationResult fetch_server_keys(const std::string& server_name, VerifyKeyBundle& out_bundle);
    
    // Verification and caching half of fetch_server_keys, usable on bundles
    // obtained any other way
    federation::FederationResult process_key_bundle(
        const json::Value& document,
        const std::string& expected_server,
        VerifyKeyBundle& out_bundle
    );
    
    // The signed document this server publishes at /_matrix/key/v2/server
    federation::FederationResult build_local_key_bundle(const std::string& server_name, json::Value& out_document);
    
    size_t prune_expired();
    
    void set_clock(std::function<SystemClock::time_point()> clock);
    const KeyStoreConfig& config() const { return config_; }

private:
    SystemClock::time_point now() const { return clock_(); }
    
    std::shared_ptr<storage::KeyCacheStore> store_;
    std::shared_ptr<federation::ServerResolver> resolver_;
    std::shared_ptr<federation::HttpClient> http_client_;
    KeyStoreConfig config_;
    std::function<SystemClock::time_point()> clock_;
    
    federation::TtlCache<std::string, federation::FederationResult> trust_failures_;
    std::mutex local_key_mutex_;
};

}

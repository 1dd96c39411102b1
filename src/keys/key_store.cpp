#include "fedtrust/keys/key_store.hpp"
#include "fedtrust/core/config.hpp"
#include "fedtrust/core/logger.hpp"
#include "fedtrust/core/utils.hpp"
#include "fedtrust/crypto/base64.hpp"
#include "fedtrust/crypto/signature.hpp"
#include "fedtrust/signing/json_signer.hpp"
#include <algorithm>

namespace fedtrust::keys {

using core::utils::TimeUtils;
using federation::ErrorClass;
using federation::FederationError;
using federation::FederationResult;

namespace {

std::string trust_cache_key(const std::string& server_name, const std::string& key_id) {
    return server_name + " " + key_id;
}

}

KeyStoreConfig KeyStoreConfig::from_config(const core::Config& config) {
    KeyStoreConfig result;
    result.key_id = config.get_string("server.key_id", result.key_id);
    result.max_validity = config.get_duration("keys.max_validity_days", std::chrono::days(7));
    result.local_validity = config.get_duration("keys.local_validity_days", std::chrono::days(7));
    result.negative_cache_ttl = config.get_duration("keys.negative_cache_minutes", std::chrono::minutes(10));
    result.timeout = config.get_duration("resolver.timeout_ms", result.timeout);
    return result;
}

KeyStore::KeyStore(
    std::shared_ptr<storage::KeyCacheStore> store,
    std::shared_ptr<federation::ServerResolver> resolver,
    std::shared_ptr<federation::HttpClient> http_client,
    KeyStoreConfig config)
    : store_(std::move(store))
    , resolver_(std::move(resolver))
    , http_client_(std::move(http_client))
    , config_(std::move(config))
    , clock_([] { return SystemClock::now(); }) {
}

void KeyStore::set_clock(std::function<SystemClock::time_point()> clock) {
    clock_ = std::move(clock);
}

FederationResult KeyStore::get_server_public_key(
    const std::string& server_name,
    const std::string& key_id,
    std::string& out_public_key) {
    
    if (auto cached = store_->get(server_name, key_id)) {
        if (now() < cached->expires_at) {
            LOG_TRACE("Key cache hit for {} {}", server_name, key_id);
            out_public_key = cached->public_key;
            return FederationResult();
        }
        LOG_DEBUG("Cached key {} for {} is past its refresh time", key_id, server_name);
    }
    
    auto cache_key = trust_cache_key(server_name, key_id);
    if (auto failure = trust_failures_.get(cache_key)) {
        LOG_DEBUG("Key {} for {} recently failed: {}", key_id, server_name, failure->describe());
        return *failure;
    }
    
    VerifyKeyBundle bundle;
    auto result = fetch_server_keys(server_name, bundle);
    
    if (result) {
        auto it = bundle.verify_keys.find(key_id);
        if (it != bundle.verify_keys.end()) {
            out_public_key = it->second;
            return FederationResult();
        }
        result = FederationResult(FederationError::KEY_NOT_FOUND,
            server_name + " does not publish key " + key_id);
    }
    
    if (result.error_class() == ErrorClass::Trust) {
        LOG_WARN("Distrusting key {} of {}: {}", key_id, server_name, result.describe());
        trust_failures_.put(cache_key, result, config_.negative_cache_ttl);
    }
    
    return result;
}

std::future<PublicKeyOutcome> KeyStore::get_server_public_key_async(
    const std::string& server_name,
    const std::string& key_id) {
    
    return std::async(std::launch::async, [this, server_name, key_id] {
        PublicKeyOutcome outcome;
        outcome.result = get_server_public_key(server_name, key_id, outcome.public_key);
        return outcome;
    });
}

FederationResult KeyStore::fetch_server_keys(const std::string& server_name, VerifyKeyBundle& out_bundle) {
    federation::ResolvedServer server;
    auto result = resolver_->resolve(server_name, server);
    if (!result) {
        return result;
    }
    
    federation::HttpRequest request;
    request.method = "GET";
    request.url = server.url("/_matrix/key/v2/server");
    request.connect_to = server.endpoint();
    request.headers.emplace_back("Host", server.host_header);
    request.headers.emplace_back("Accept", "application/json");
    request.timeout = config_.timeout;
    
    LOG_DEBUG("Fetching server keys for {} from {}", server_name, server.endpoint());
    
    federation::HttpResponse response;
    result = http_client_->perform(request, response);
    if (!result) {
        return result;
    }
    
    if (!response.ok()) {
        return FederationResult(FederationError::HTTP_FAILURE,
            "Key server for " + server_name + " returned HTTP " + std::to_string(response.status));
    }
    
    auto document = json::try_parse(response.body);
    if (!document) {
        return FederationResult(FederationError::INVALID_RESPONSE,
            "Key server for " + server_name + " returned malformed JSON");
    }
    
    return process_key_bundle(*document, server_name, out_bundle);
}

FederationResult KeyStore::process_key_bundle(
    const json::Value& document,
    const std::string& expected_server,
    VerifyKeyBundle& out_bundle) {
    
    VerifyKeyBundle bundle;
    auto result = VerifyKeyBundle::from_json(document, bundle);
    if (!result) {
        return result;
    }
    
    if (bundle.server_name != expected_server) {
        return FederationResult(FederationError::SERVER_NAME_MISMATCH,
            "Asked " + expected_server + " for keys but got keys for " + bundle.server_name);
    }
    
    auto self_signed = signing::JsonSigner::verify_json(bundle.raw, expected_server,
        [&bundle](const std::string& key_id) -> std::optional<std::string> {
            auto it = bundle.verify_keys.find(key_id);
            if (it == bundle.verify_keys.end()) {
                return std::nullopt;
            }
            return it->second;
        });
    
    if (!self_signed) {
        return FederationResult(FederationError::UNTRUSTED_KEY_BUNDLE,
            "Key bundle from " + expected_server + " is not self-signed: " + self_signed.message);
    }
    
    // Capped in milliseconds, since a remote valid_until_ts can exceed what a
    // system_clock time_point holds
    auto fetched_at = now();
    auto cap_millis = TimeUtils::to_unix_millis(fetched_at + config_.max_validity);
    auto effective_until = TimeUtils::from_unix_millis(std::min(bundle.valid_until_ts, cap_millis));
    
    if (effective_until <= fetched_at) {
        return FederationResult(FederationError::KEY_EXPIRED,
            "Keys for " + expected_server + " expired at " + std::to_string(bundle.valid_until_ts));
    }
    
    auto cache_until = fetched_at + (effective_until - fetched_at) / 2;
    
    for (const auto& [key_id, public_key] : bundle.verify_keys) {
        if (!store_->put(expected_server, key_id, public_key, fetched_at, cache_until)) {
            LOG_WARN("Failed to cache key {} for {}", key_id, expected_server);
        }
    }
    
    LOG_INFO("Trusted {} keys for {}, cached for {}", bundle.verify_keys.size(), expected_server,
             TimeUtils::format_duration(
                 std::chrono::duration_cast<std::chrono::milliseconds>(cache_until - fetched_at)));
    
    out_bundle = std::move(bundle);
    return FederationResult();
}

FederationResult KeyStore::get_server_signing_key(
    const std::string& server_name,
    storage::ServerSigningKey& out_key) {
    
    std::lock_guard<std::mutex> lock(local_key_mutex_);
    
    if (auto existing = store_->get_local_key(server_name)) {
        if (existing->private_key) {
            out_key = *existing;
            return FederationResult();
        }
        LOG_WARN("Active key {} for {} has no private half, minting a new one", existing->key_id, server_name);
    }
    
    crypto::KeyPair keypair;
    auto generated = crypto::generate_signing_key(keypair);
    if (!generated) {
        return FederationResult(FederationError::STORAGE_FAILURE,
            "Failed to generate signing key: " + generated.describe());
    }
    
    storage::ServerSigningKey key;
    key.key_id = config_.key_id;
    key.server_name = server_name;
    key.private_key = crypto::encode_base64(keypair.seed.span(), crypto::Base64Variant::StandardPadded);
    key.public_key = crypto::encode_public_key(keypair.public_key);
    key.created_at = now();
    key.is_active = true;
    
    if (!store_->put_local_key(key)) {
        return FederationResult(FederationError::STORAGE_FAILURE,
            "Failed to persist signing key for " + server_name);
    }
    
    LOG_INFO("Minted signing key {} for {}", key.key_id, server_name);
    out_key = std::move(key);
    return FederationResult();
}

FederationResult KeyStore::build_local_key_bundle(const std::string& server_name, json::Value& out_document) {
    storage::ServerSigningKey key;
    auto result = get_server_signing_key(server_name, key);
    if (!result) {
        return result;
    }
    
    auto valid_until = now() + config_.local_validity;
    
    json::Value document = {
        {"server_name", server_name},
        {"verify_keys", {{key.key_id, {{"key", key.public_key}}}}},
        {"old_verify_keys", json::Value::object()},
        {"valid_until_ts", TimeUtils::to_unix_millis(valid_until)}
    };
    
    crypto::SecureBytes seed;
    if (!crypto::decode_base64(*key.private_key, seed.data)) {
        return FederationResult(FederationError::STORAGE_FAILURE, "Stored signing key is malformed");
    }
    
    auto signed_result = signing::JsonSigner::sign_json(document, server_name, key.key_id, seed.span());
    if (!signed_result) {
        return FederationResult(FederationError::INVALID_SIGNATURE,
            "Failed to sign key bundle: " + signed_result.describe());
    }
    
    out_document = std::move(document);
    return FederationResult();
}

size_t KeyStore::prune_expired() {
    trust_failures_.prune_expired();
    return store_->prune_expired(now());
}

}

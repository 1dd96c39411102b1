#pragma once

#include "fedtrust/federation/dns_client.hpp"
#include "fedtrust/federation/http_client.hpp"
#include "fedtrust/federation/ttl_cache.hpp"
#include "fedtrust/keys/key_provider.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace fedtrust::test {

// Scripted DNS. Unknown hosts have no addresses and no SRV records.
class FakeDnsClient : public federation::DnsClient {
public:
    federation::FederationResult lookup_ip(
        const std::string& hostname,
        std::chrono::milliseconds,
        std::vector<std::string>& out_addresses) override {
        
        std::lock_guard<std::mutex> lock(mutex_);
        ++ip_lookups;
        ip_queries.push_back(hostname);
        
        auto error = ip_errors.find(hostname);
        if (error != ip_errors.end()) {
            return error->second;
        }
        
        auto it = addresses.find(hostname);
        if (it == addresses.end()) {
            return federation::FederationResult(federation::FederationError::DNS_FAILURE,
                                                "No addresses for " + hostname);
        }
        out_addresses = it->second;
        return federation::FederationResult();
    }
    
    federation::FederationResult lookup_srv(
        const std::string& service_name,
        std::chrono::milliseconds,
        std::vector<federation::SrvRecord>& out_records) override {
        
        std::lock_guard<std::mutex> lock(mutex_);
        ++srv_lookups;
        srv_queries.push_back(service_name);
        
        auto error = srv_errors.find(service_name);
        if (error != srv_errors.end()) {
            return error->second;
        }
        
        auto it = srv_records.find(service_name);
        out_records = it == srv_records.end() ? std::vector<federation::SrvRecord>{} : it->second;
        return federation::FederationResult();
    }
    
    size_t lookup_count() const { return ip_lookups + srv_lookups; }
    
    std::map<std::string, std::vector<std::string>> addresses;
    std::map<std::string, federation::FederationResult> ip_errors;
    std::map<std::string, std::vector<federation::SrvRecord>> srv_records;
    std::map<std::string, federation::FederationResult> srv_errors;
    
    std::atomic<size_t> ip_lookups{0};
    std::atomic<size_t> srv_lookups{0};
    std::vector<std::string> ip_queries;
    std::vector<std::string> srv_queries;

private:
    std::mutex mutex_;
};

// Scripted HTTP keyed by URL. Unknown URLs answer 404.
class FakeHttpClient : public federation::HttpClient {
public:
    federation::FederationResult perform(
        const federation::HttpRequest& request,
        federation::HttpResponse& out_response) override {
        
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        
        auto error = transport_errors.find(request.url);
        if (error != transport_errors.end()) {
            return error->second;
        }
        
        auto it = responses.find(request.url);
        if (it == responses.end()) {
            out_response = federation::HttpResponse{404, "{\"errcode\":\"M_NOT_FOUND\"}"};
        } else {
            out_response = it->second;
        }
        return federation::FederationResult();
    }
    
    void respond(const std::string& url, long status, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses[url] = federation::HttpResponse{status, body};
    }
    
    void fail(const std::string& url,
              federation::FederationError error = federation::FederationError::HTTP_FAILURE,
              const std::string& message = "connection refused") {
        std::lock_guard<std::mutex> lock(mutex_);
        transport_errors[url] = federation::FederationResult(error, message);
    }
    
    size_t request_count(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& request : requests) {
            if (request.url == url) {
                ++count;
            }
        }
        return count;
    }
    
    std::vector<federation::HttpRequest> requests;

private:
    std::mutex mutex_;
    std::map<std::string, federation::HttpResponse> responses;
    std::map<std::string, federation::FederationResult> transport_errors;
};

// Public keys handed out from a fixed table
class StaticKeyProvider : public keys::PublicKeyProvider {
public:
    federation::FederationResult get_server_public_key(
        const std::string& server_name,
        const std::string& key_id,
        std::string& out_public_key) override {
        
        ++lookups;
        auto it = keys.find(server_name + " " + key_id);
        if (it == keys.end()) {
            return federation::FederationResult(federation::FederationError::KEY_NOT_FOUND,
                                                "No key " + key_id + " for " + server_name);
        }
        out_public_key = it->second;
        return federation::FederationResult();
    }
    
    void add(const std::string& server_name, const std::string& key_id, const std::string& public_key) {
        keys[server_name + " " + key_id] = public_key;
    }
    
    std::map<std::string, std::string> keys;
    std::atomic<size_t> lookups{0};
};

// Always hands out the same local key
class FixedLocalKeyProvider : public keys::LocalKeyProvider {
public:
    explicit FixedLocalKeyProvider(storage::ServerSigningKey key) : key_(std::move(key)) {}
    
    federation::FederationResult get_server_signing_key(
        const std::string& server_name,
        storage::ServerSigningKey& out_key) override {
        
        if (server_name != key_.server_name) {
            return federation::FederationResult(federation::FederationError::KEY_NOT_FOUND,
                                                "No local key for " + server_name);
        }
        out_key = key_;
        return federation::FederationResult();
    }

private:
    storage::ServerSigningKey key_;
};

// Seed and public key of the published Matrix signing example
inline const std::string MATRIX_EXAMPLE_SEED = "YJDBA9Xnr2sVqXD9Vj7XVUnmFZcZrlw8Md7kMW+3XA0=";
inline const std::string MATRIX_EXAMPLE_PUBLIC_KEY = "XGX0JRS2Af3be3knz2fBiRbApjm2Dh61gXDJA8kcJNI=";

inline storage::ServerSigningKey example_signing_key(const std::string& server_name, const std::string& key_id = "ed25519:1") {
    storage::ServerSigningKey key;
    key.key_id = key_id;
    key.server_name = server_name;
    key.private_key = MATRIX_EXAMPLE_SEED;
    key.public_key = MATRIX_EXAMPLE_PUBLIC_KEY;
    key.is_active = true;
    return key;
}

// Manually advanced steady clock for cache and backoff tests
class ManualClock {
public:
    federation::Clock::time_point now() const { return now_; }
    void advance(federation::Clock::duration by) { now_ += by; }
    
    auto source() { return [this] { return now_; }; }

private:
    federation::Clock::time_point now_ = federation::Clock::time_point() + std::chrono::hours(1000);
};

}

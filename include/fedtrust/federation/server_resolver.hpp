#pragma once

#include "fedtrust/federation/backoff.hpp"
#include "fedtrust/federation/dns_client.hpp"
#include "fedtrust/federation/federation_error.hpp"
#include "fedtrust/federation/http_client.hpp"
#include "fedtrust/federation/resolved_server.hpp"
#include "fedtrust/federation/server_name.hpp"
#include "fedtrust/federation/ttl_cache.hpp"
#include "fedtrust/federation/well_known_client.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace fedtrust::core {
class Config;
}

namespace fedtrust::federation {

struct ResolverConfig {
    std::chrono::milliseconds timeout{10000};
    Clock::duration well_known_ttl = std::chrono::hours(24);
    Clock::duration error_ttl = std::chrono::hours(1);
    Clock::duration backoff_base = std::chrono::seconds(1);
    std::uint32_t backoff_max_exponent = 10;
    Clock::duration backoff_prune_after = std::chrono::hours(24);
    
    static ResolverConfig from_config(const core::Config& config);
};

struct ResolveOutcome {
    FederationResult result;
    ResolvedServer server;
};

// Turns a server name into a connection target: IP literal, explicit port,
// .well-known delegation, _matrix-fed._tcp then _matrix._tcp SRV, and
// finally hostname:8448, first match wins. Failures are cached and back
// the server off; a server inside its backoff window is refused without
// any network I/O.
class ServerResolver {
public:
    ServerResolver(
        std::shared_ptr<DnsClient> dns_client,
        std::shared_ptr<HttpClient> http_client,
        ResolverConfig config = {}
    );
    ~ServerResolver();
    
    FederationResult resolve(const std::string& server_name, ResolvedServer& out_server);
    std::future<ResolveOutcome> resolve_async(const std::string& server_name);
    
    // Periodic sweep of expired cache entries and idle backoff state
    void cleanup_cache();
    void forget(const std::string& server_name);
    
    const BackoffTracker& backoff_tracker() const { return backoff_; }
    const ResolverConfig& config() const { return config_; }
    size_t well_known_cache_size() const { return well_known_cache_.size(); }
    size_t error_cache_size() const { return error_cache_.size(); }
    
    void set_clock(std::function<Clock::time_point()> clock);

private:
    FederationResult resolve_uncached(const std::string& server_name, ResolvedServer& out_server);
    FederationResult resolve_delegated(const std::string& delegated_name, ResolvedServer& out_server);
    FederationResult resolve_srv(const std::string& hostname, ResolutionMethod method, ResolvedServer& out_server);
    FederationResult lookup_address(const std::string& hostname, std::string& out_address);
    std::optional<WellKnownResponse> lookup_well_known(const std::string& hostname);
    
    Clock::time_point now() const { return clock_(); }
    
    std::shared_ptr<DnsClient> dns_client_;
    WellKnownClient well_known_client_;
    ResolverConfig config_;
    std::function<Clock::time_point()> clock_;
    
    TtlCache<std::string, std::optional<WellKnownResponse>> well_known_cache_;
    TtlCache<std::string, FederationResult> error_cache_;
    BackoffTracker backoff_;
};

}

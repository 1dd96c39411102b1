#include "fedtrust/federation/server_resolver.hpp"
#include "fedtrust/core/config.hpp"
#include "fedtrust/core/logger.hpp"

namespace fedtrust::federation {

namespace {

const char* srv_service(ResolutionMethod method) {
    return method == ResolutionMethod::SrvMatrixFed ? "_matrix-fed._tcp." : "_matrix._tcp.";
}

}

ResolverConfig ResolverConfig::from_config(const core::Config& config) {
    ResolverConfig result;
    result.timeout = config.get_duration("resolver.timeout_ms", result.timeout);
    result.well_known_ttl = config.get_duration("resolver.well_known_ttl_hours", std::chrono::hours(24));
    result.error_ttl = config.get_duration("resolver.error_ttl_minutes", std::chrono::minutes(60));
    result.backoff_base = config.get_duration("resolver.backoff_base_ms", std::chrono::milliseconds(1000));
    result.backoff_max_exponent = static_cast<std::uint32_t>(config.get_int("resolver.backoff_max_exponent", 10));
    result.backoff_prune_after = config.get_duration("resolver.backoff_prune_hours", std::chrono::hours(24));
    return result;
}

ServerResolver::ServerResolver(
    std::shared_ptr<DnsClient> dns_client,
    std::shared_ptr<HttpClient> http_client,
    ResolverConfig config)
    : dns_client_(std::move(dns_client))
    , well_known_client_(std::move(http_client), config.timeout)
    , config_(config)
    , clock_([] { return Clock::now(); })
    , backoff_(config.backoff_base, config.backoff_max_exponent, config.backoff_prune_after) {
}

ServerResolver::~ServerResolver() = default;

void ServerResolver::set_clock(std::function<Clock::time_point()> clock) {
    clock_ = std::move(clock);
}

FederationResult ServerResolver::resolve(const std::string& server_name, ResolvedServer& out_server) {
    LOG_DEBUG("Resolving server {}", server_name);
    
    if (!backoff_.can_retry(server_name, now())) {
        auto state = backoff_.state(server_name);
        LOG_DEBUG("Refusing to resolve {}: backing off after {} failures",
                  server_name, state ? state->failure_count : 0);
        return FederationResult(FederationError::BACKOFF, "Server " + server_name + " is in backoff");
    }
    
    if (auto cached = error_cache_.get(server_name, now())) {
        LOG_DEBUG("Returning cached error for {}: {}", server_name, cached->describe());
        return *cached;
    }
    
    ResolvedServer resolved;
    auto result = resolve_uncached(server_name, resolved);
    
    if (result) {
        backoff_.record_success(server_name);
        LOG_INFO("Resolved {} to {} via {} (host {})", server_name, resolved.endpoint(),
                 to_string(resolved.resolution_method), resolved.host_header);
        out_server = std::move(resolved);
        return result;
    }
    
    if (result.error == FederationError::INVALID_SERVER_NAME) {
        LOG_WARN("Rejected server name '{}': {}", server_name, result.message);
        return result;
    }
    
    backoff_.record_failure(server_name, now());
    error_cache_.put(server_name, result, config_.error_ttl, now());
    LOG_WARN("Failed to resolve {}: {}", server_name, result.describe());
    return result;
}

std::future<ResolveOutcome> ServerResolver::resolve_async(const std::string& server_name) {
    return std::async(std::launch::async, [this, server_name] {
        ResolveOutcome outcome;
        outcome.result = resolve(server_name, outcome.server);
        return outcome;
    });
}

void ServerResolver::cleanup_cache() {
    auto current = now();
    size_t well_known = well_known_cache_.prune_expired(current);
    size_t errors = error_cache_.prune_expired(current);
    size_t backoff = backoff_.prune(current);
    
    LOG_DEBUG("Resolver cache sweep removed {} well-known, {} error and {} backoff entries",
              well_known, errors, backoff);
}

void ServerResolver::forget(const std::string& server_name) {
    error_cache_.erase(server_name);
    backoff_.record_success(server_name);
    
    ServerName parsed;
    if (parse_server_name(server_name, parsed)) {
        well_known_cache_.erase(parsed.hostname);
    }
}

FederationResult ServerResolver::resolve_uncached(const std::string& server_name, ResolvedServer& out_server) {
    ServerName parsed;
    auto result = parse_server_name(server_name, parsed);
    if (!result) {
        return result;
    }
    
    const std::string& hostname = parsed.hostname;
    
    if (is_ip_literal(hostname)) {
        out_server = ResolvedServer{
            hostname,
            parsed.port.value_or(DEFAULT_FEDERATION_PORT),
            server_name,
            hostname,
            ResolutionMethod::IpLiteral
        };
        return FederationResult();
    }
    
    if (parsed.port) {
        std::string address;
        result = lookup_address(hostname, address);
        if (!result) {
            return result;
        }
        out_server = ResolvedServer{address, *parsed.port, server_name, hostname, ResolutionMethod::ExplicitPort};
        return FederationResult();
    }
    
    if (auto delegation = lookup_well_known(hostname)) {
        ResolvedServer delegated;
        result = resolve_delegated(delegation->server, delegated);
        if (result) {
            out_server = std::move(delegated);
            return result;
        }
        LOG_DEBUG("Delegation {} -> {} did not resolve: {}", hostname, delegation->server, result.describe());
    }
    
    for (auto method : {ResolutionMethod::SrvMatrixFed, ResolutionMethod::SrvMatrixLegacy}) {
        ResolvedServer via_srv;
        result = resolve_srv(hostname, method, via_srv);
        if (result) {
            out_server = std::move(via_srv);
            return result;
        }
        LOG_DEBUG("{}{} did not resolve: {}", srv_service(method), hostname, result.describe());
    }
    
    std::string address;
    result = lookup_address(hostname, address);
    if (!result) {
        return result;
    }
    
    out_server = ResolvedServer{address, DEFAULT_FEDERATION_PORT, hostname, hostname,
                                ResolutionMethod::FallbackPort8448};
    return FederationResult();
}

FederationResult ServerResolver::resolve_delegated(const std::string& delegated_name, ResolvedServer& out_server) {
    ServerName parsed;
    auto result = parse_server_name(delegated_name, parsed);
    if (!result) {
        return result;
    }
    
    const std::string& hostname = parsed.hostname;
    out_server.resolution_method = ResolutionMethod::WellKnownDelegation;
    
    if (is_ip_literal(hostname)) {
        out_server.ip_address = hostname;
        out_server.port = parsed.port.value_or(DEFAULT_FEDERATION_PORT);
        out_server.host_header = format_host(hostname, out_server.port);
        out_server.tls_hostname = hostname;
        return FederationResult();
    }
    
    if (parsed.port) {
        result = lookup_address(hostname, out_server.ip_address);
        if (!result) {
            return result;
        }
        out_server.port = *parsed.port;
        out_server.host_header = format_host(hostname, parsed.port);
        out_server.tls_hostname = hostname;
        return FederationResult();
    }
    
    for (auto method : {ResolutionMethod::SrvMatrixFed, ResolutionMethod::SrvMatrixLegacy}) {
        ResolvedServer via_srv;
        if (resolve_srv(hostname, method, via_srv)) {
            out_server.ip_address = via_srv.ip_address;
            out_server.port = via_srv.port;
            out_server.host_header = hostname;
            out_server.tls_hostname = hostname;
            return FederationResult();
        }
    }
    
    result = lookup_address(hostname, out_server.ip_address);
    if (!result) {
        return result;
    }
    out_server.port = DEFAULT_FEDERATION_PORT;
    out_server.host_header = hostname;
    out_server.tls_hostname = hostname;
    return FederationResult();
}

FederationResult ServerResolver::resolve_srv(
    const std::string& hostname,
    ResolutionMethod method,
    ResolvedServer& out_server) {
    
    std::string service_name = srv_service(method) + hostname;
    
    std::vector<SrvRecord> records;
    auto result = dns_client_->lookup_srv(service_name, config_.timeout, records);
    if (!result) {
        return result;
    }
    
    if (records.empty()) {
        return FederationResult(FederationError::NO_SERVER_FOUND, "No SRV records for " + service_name);
    }
    
    sort_srv_records(records);
    
    for (const auto& record : records) {
        LOG_DEBUG("Trying SRV target {}:{} (priority {}, weight {})",
                  record.target, record.port, record.priority, record.weight);
        
        std::string address;
        auto lookup = lookup_address(record.target, address);
        if (!lookup) {
            LOG_DEBUG("SRV target {} did not resolve: {}", record.target, lookup.describe());
            continue;
        }
        
        out_server = ResolvedServer{address, record.port, hostname, hostname, method};
        return FederationResult();
    }
    
    return FederationResult(FederationError::NO_SERVER_FOUND, "All SRV targets failed for " + service_name);
}

FederationResult ServerResolver::lookup_address(const std::string& hostname, std::string& out_address) {
    std::vector<std::string> addresses;
    auto result = dns_client_->lookup_ip(hostname, config_.timeout, addresses);
    if (!result) {
        return result;
    }
    
    if (addresses.empty()) {
        return FederationResult(FederationError::NO_SERVER_FOUND, "No addresses for " + hostname);
    }
    
    out_address = addresses.front();
    return FederationResult();
}

std::optional<WellKnownResponse> ServerResolver::lookup_well_known(const std::string& hostname) {
    if (auto cached = well_known_cache_.get(hostname, now())) {
        LOG_DEBUG("Well-known cache hit for {} ({})", hostname, *cached ? "delegated" : "none");
        return *cached;
    }
    
    WellKnownResponse response;
    auto result = well_known_client_.fetch(hostname, response);
    
    std::optional<WellKnownResponse> entry;
    if (result) {
        entry = response;
    } else {
        LOG_DEBUG("No well-known delegation for {}: {}", hostname, result.message);
    }
    
    well_known_cache_.put(hostname, entry, config_.well_known_ttl, now());
    return entry;
}

}

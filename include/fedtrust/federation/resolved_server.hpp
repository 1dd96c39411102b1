#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fedtrust::federation {

enum class ResolutionMethod {
    IpLiteral,
    ExplicitPort,
    WellKnownDelegation,
    SrvMatrixFed,
    SrvMatrixLegacy,
    FallbackPort8448
};

const char* to_string(ResolutionMethod method);

// Where to connect and which identity to present. host_header and
// tls_hostname name the (possibly delegated) server, never the connection
// IP, except for IP literals.
struct ResolvedServer {
    std::string ip_address;
    std::uint16_t port = 0;
    std::string host_header;
    std::string tls_hostname;
    ResolutionMethod resolution_method = ResolutionMethod::FallbackPort8448;
    
    // https://{tls_hostname}:{port}{path}; the connection itself is pinned
    // to ip_address by the HTTP client
    std::string url(const std::string& path) const;
    std::string endpoint() const;
    
    bool operator==(const ResolvedServer&) const = default;
};

struct SrvRecord {
    std::uint16_t priority = 0;
    std::uint16_t weight = 0;
    std::uint16_t port = 0;
    std::string target;
    
    bool operator==(const SrvRecord&) const = default;
};

// Lower priority first, then higher weight first; target and port break
// remaining ties so the order is total
bool srv_precedes(const SrvRecord& a, const SrvRecord& b);
void sort_srv_records(std::vector<SrvRecord>& records);

}

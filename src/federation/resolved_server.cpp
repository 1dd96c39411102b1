#include "fedtrust/federation/resolved_server.hpp"
#include "fedtrust/federation/server_name.hpp"
#include <algorithm>

namespace fedtrust::federation {

const char* to_string(ResolutionMethod method) {
    switch (method) {
        case ResolutionMethod::IpLiteral: return "ip-literal";
        case ResolutionMethod::ExplicitPort: return "explicit-port";
        case ResolutionMethod::WellKnownDelegation: return "well-known";
        case ResolutionMethod::SrvMatrixFed: return "srv-matrix-fed";
        case ResolutionMethod::SrvMatrixLegacy: return "srv-matrix";
        case ResolutionMethod::FallbackPort8448: return "fallback-8448";
    }
    return "unknown";
}

std::string ResolvedServer::url(const std::string& path) const {
    std::string result = "https://" + format_host(tls_hostname, port);
    if (path.empty() || path.front() != '/') {
        result += '/';
    }
    return result + path;
}

std::string ResolvedServer::endpoint() const {
    return format_host(ip_address, port);
}

bool srv_precedes(const SrvRecord& a, const SrvRecord& b) {
    if (a.priority != b.priority) {
        return a.priority < b.priority;
    }
    if (a.weight != b.weight) {
        return a.weight > b.weight;
    }
    if (a.target != b.target) {
        return a.target < b.target;
    }
    return a.port < b.port;
}

void sort_srv_records(std::vector<SrvRecord>& records) {
    std::stable_sort(records.begin(), records.end(), srv_precedes);
}

}

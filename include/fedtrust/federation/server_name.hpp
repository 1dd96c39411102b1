#pragma once

#include "fedtrust/federation/federation_error.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace fedtrust::federation {

constexpr std::uint16_t DEFAULT_FEDERATION_PORT = 8448;

struct ServerName {
    std::string hostname;            // IPv6 literals without brackets
    std::optional<std::uint16_t> port;
    
    bool operator==(const ServerName&) const = default;
};

// Accepts "host", "host:port", "[v6]", "[v6]:port" and bare IPv6 ("::1"),
// where a hostname that still contains ':' after splitting off the last
// colon is taken whole with no port.
FederationResult parse_server_name(const std::string& server_name, ServerName& out);

bool is_ip_literal(const std::string& hostname);
bool is_ipv6_literal(const std::string& hostname);

// Wraps IPv6 literals in brackets for use in URLs and Host headers
std::string format_host(const std::string& host, std::optional<std::uint16_t> port = std::nullopt);

}

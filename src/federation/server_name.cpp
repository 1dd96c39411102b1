#include "fedtrust/federation/server_name.hpp"
#include <boost/asio/ip/address.hpp>
#include <charconv>

namespace fedtrust::federation {

namespace {

bool parse_port(const std::string& text, std::uint16_t& port) {
    if (text.empty()) {
        return false;
    }
    
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    return ec == std::errc() && end == text.data() + text.size();
}

}

FederationResult parse_server_name(const std::string& server_name, ServerName& out) {
    if (server_name.empty()) {
        return FederationResult(FederationError::INVALID_SERVER_NAME, "Empty server name");
    }
    
    if (server_name.front() == '[') {
        auto bracket_end = server_name.find(']');
        if (bracket_end == std::string::npos) {
            return FederationResult(FederationError::INVALID_SERVER_NAME,
                "Unclosed IPv6 literal: " + server_name);
        }
        
        std::string host = server_name.substr(1, bracket_end - 1);
        std::string remainder = server_name.substr(bracket_end + 1);
        
        if (host.empty()) {
            return FederationResult(FederationError::INVALID_SERVER_NAME,
                "Empty IPv6 literal: " + server_name);
        }
        
        if (remainder.empty()) {
            out = ServerName{host, std::nullopt};
            return FederationResult();
        }
        
        if (remainder.front() != ':') {
            return FederationResult(FederationError::INVALID_SERVER_NAME,
                "Invalid IPv6 literal: " + server_name);
        }
        
        std::uint16_t port = 0;
        if (!parse_port(remainder.substr(1), port)) {
            return FederationResult(FederationError::INVALID_SERVER_NAME,
                "Invalid port: " + remainder.substr(1));
        }
        
        out = ServerName{host, port};
        return FederationResult();
    }
    
    auto colon = server_name.rfind(':');
    if (colon == std::string::npos) {
        out = ServerName{server_name, std::nullopt};
        return FederationResult();
    }
    
    std::string host = server_name.substr(0, colon);
    if (host.find(':') != std::string::npos) {
        // Bare IPv6 literal
        out = ServerName{server_name, std::nullopt};
        return FederationResult();
    }
    
    if (host.empty()) {
        return FederationResult(FederationError::INVALID_SERVER_NAME,
            "Missing hostname: " + server_name);
    }
    
    std::uint16_t port = 0;
    std::string port_text = server_name.substr(colon + 1);
    if (!parse_port(port_text, port)) {
        return FederationResult(FederationError::INVALID_SERVER_NAME, "Invalid port: " + port_text);
    }
    
    out = ServerName{host, port};
    return FederationResult();
}

bool is_ip_literal(const std::string& hostname) {
    boost::system::error_code ec;
    boost::asio::ip::make_address(hostname, ec);
    return !ec;
}

bool is_ipv6_literal(const std::string& hostname) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(hostname, ec);
    return !ec && address.is_v6();
}

std::string format_host(const std::string& host, std::optional<std::uint16_t> port) {
    std::string result = is_ipv6_literal(host) ? "[" + host + "]" : host;
    if (port) {
        result += ":" + std::to_string(*port);
    }
    return result;
}

}

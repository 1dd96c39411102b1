#pragma once

#include "fedtrust/federation/federation_error.hpp"
#include "fedtrust/federation/resolved_server.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace fedtrust::federation {

class DnsClient {
public:
    virtual ~DnsClient() = default;
    
    // A/AAAA lookup. Addresses are returned in resolver order.
    virtual FederationResult lookup_ip(
        const std::string& hostname,
        std::chrono::milliseconds timeout,
        std::vector<std::string>& out_addresses
    ) = 0;
    
    // A name with no SRV records is a successful, empty answer.
    virtual FederationResult lookup_srv(
        const std::string& service_name,
        std::chrono::milliseconds timeout,
        std::vector<SrvRecord>& out_records
    ) = 0;
};

// Boost.Asio resolver for addresses, the system resolver library for SRV.
// Address lookups run on an io_context owned by the client, so a caller gives up
// at its deadline while a stuck getaddrinfo finishes in the background.
class SystemDnsClient : public DnsClient {
public:
    SystemDnsClient();
    ~SystemDnsClient() override;
    
    SystemDnsClient(const SystemDnsClient&) = delete;
    SystemDnsClient& operator=(const SystemDnsClient&) = delete;
    
    FederationResult lookup_ip(
        const std::string& hostname,
        std::chrono::milliseconds timeout,
        std::vector<std::string>& out_addresses
    ) override;
    
    FederationResult lookup_srv(
        const std::string& service_name,
        std::chrono::milliseconds timeout,
        std::vector<SrvRecord>& out_records
    ) override;

private:
    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::atomic<bool> running_{true};
    std::thread io_thread_;
};

}

#include "fedtrust/federation/dns_client.hpp"
#include "fedtrust/core/logger.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <arpa/nameser.h>
#include <netinet/in.h>
#include <resolv.h>
#include <algorithm>
#include <array>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace fedtrust::federation {

using tcp = boost::asio::ip::tcp;

namespace {

// Shared with the completion handler, which may run after the caller timed out
struct PendingLookup {
    std::mutex mutex;
    std::condition_variable done;
    std::optional<boost::system::error_code> outcome;
    tcp::resolver::results_type results;
};

}

SystemDnsClient::SystemDnsClient()
    : work_(boost::asio::make_work_guard(io_context_)) {
    io_thread_ = std::thread([this]() {
        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("DNS io_context error: {}", e.what());
                io_context_.restart();
            }
        }
    });
}

SystemDnsClient::~SystemDnsClient() {
    running_ = false;
    work_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

FederationResult SystemDnsClient::lookup_ip(
    const std::string& hostname,
    std::chrono::milliseconds timeout,
    std::vector<std::string>& out_addresses) {
    
    out_addresses.clear();
    
    // Destroying the resolver on return abandons a timed-out lookup. Its handler
    // still runs with operation_aborted once getaddrinfo returns.
    auto pending = std::make_shared<PendingLookup>();
    tcp::resolver resolver(io_context_);
    
    resolver.async_resolve(hostname, "",
        [pending](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            std::lock_guard<std::mutex> lock(pending->mutex);
            pending->outcome = ec;
            pending->results = std::move(results);
            pending->done.notify_all();
        });
    
    std::unique_lock<std::mutex> lock(pending->mutex);
    if (!pending->done.wait_for(lock, timeout, [&pending]() { return pending->outcome.has_value(); })) {
        LOG_DEBUG("Address lookup for {} timed out after {}ms", hostname, timeout.count());
        return FederationResult(FederationError::DNS_TIMEOUT, "Address lookup timed out for " + hostname);
    }
    
    auto outcome = *pending->outcome;
    auto results = std::move(pending->results);
    lock.unlock();
    
    if (outcome) {
        LOG_DEBUG("Address lookup for {} failed: {}", hostname, outcome.message());
        return FederationResult(FederationError::DNS_FAILURE,
            "Address lookup failed for " + hostname + ": " + outcome.message());
    }
    
    for (const auto& entry : results) {
        auto address = entry.endpoint().address().to_string();
        if (std::find(out_addresses.begin(), out_addresses.end(), address) == out_addresses.end()) {
            out_addresses.push_back(address);
        }
    }
    
    if (out_addresses.empty()) {
        return FederationResult(FederationError::DNS_FAILURE, "No addresses for " + hostname);
    }
    
    return FederationResult();
}

namespace {

// Blocking res_nquery. Runs on its own thread so the caller can stop waiting,
// and does not log since it may outlive the logger.
FederationResult query_srv(
    const std::string& service_name,
    std::chrono::milliseconds timeout,
    std::vector<SrvRecord>& out_records) {
    
    struct __res_state state {};
    if (res_ninit(&state) != 0) {
        return FederationResult(FederationError::DNS_FAILURE, "Failed to initialise resolver");
    }
    
    // One attempt per server, bounded by the caller's timeout
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
    state.retrans = static_cast<int>(std::max<std::int64_t>(1, seconds));
    state.retry = 1;
    
    std::array<unsigned char, NS_PACKETSZ * 4> answer;
    int length = res_nquery(&state, service_name.c_str(), ns_c_in, ns_t_srv,
                            answer.data(), static_cast<int>(answer.size()));
    
    if (length < 0) {
        int herr = state.res_h_errno;
        res_nclose(&state);
        
        if (herr == HOST_NOT_FOUND || herr == NO_DATA) {
            return FederationResult();
        }
        if (herr == TRY_AGAIN) {
            return FederationResult(FederationError::DNS_TIMEOUT, "SRV lookup timed out for " + service_name);
        }
        return FederationResult(FederationError::DNS_FAILURE, "SRV lookup failed for " + service_name);
    }
    
    ns_msg message;
    if (ns_initparse(answer.data(), length, &message) != 0) {
        res_nclose(&state);
        return FederationResult(FederationError::DNS_FAILURE, "Malformed SRV answer for " + service_name);
    }
    
    int count = ns_msg_count(message, ns_s_an);
    for (int i = 0; i < count; ++i) {
        ns_rr rr;
        if (ns_parserr(&message, ns_s_an, i, &rr) != 0 || ns_rr_type(rr) != ns_t_srv) {
            continue;
        }
        
        if (ns_rr_rdlen(rr) < 7) {
            continue;
        }
        
        const unsigned char* rdata = ns_rr_rdata(rr);
        SrvRecord record;
        record.priority = ns_get16(rdata);
        record.weight = ns_get16(rdata + 2);
        record.port = ns_get16(rdata + 4);
        
        std::array<char, NS_MAXDNAME> target;
        if (dn_expand(ns_msg_base(message), ns_msg_end(message), rdata + 6,
                      target.data(), static_cast<int>(target.size())) < 0) {
            continue;
        }
        
        record.target = target.data();
        while (!record.target.empty() && record.target.back() == '.') {
            record.target.pop_back();
        }
        
        // "." means the service is explicitly unavailable
        if (record.target.empty()) {
            continue;
        }
        
        out_records.push_back(std::move(record));
    }
    
    res_nclose(&state);
    return FederationResult();
}

struct PendingQuery {
    std::mutex mutex;
    std::condition_variable done;
    std::optional<FederationResult> outcome;
    std::vector<SrvRecord> records;
};

}

FederationResult SystemDnsClient::lookup_srv(
    const std::string& service_name,
    std::chrono::milliseconds timeout,
    std::vector<SrvRecord>& out_records) {
    
    out_records.clear();
    
    auto pending = std::make_shared<PendingQuery>();
    std::thread([pending, service_name, timeout]() {
        std::vector<SrvRecord> records;
        auto result = query_srv(service_name, timeout, records);
        
        std::lock_guard<std::mutex> lock(pending->mutex);
        pending->outcome = std::move(result);
        pending->records = std::move(records);
        pending->done.notify_all();
    }).detach();
    
    std::unique_lock<std::mutex> lock(pending->mutex);
    if (!pending->done.wait_for(lock, timeout, [&pending]() { return pending->outcome.has_value(); })) {
        LOG_DEBUG("SRV lookup for {} timed out after {}ms", service_name, timeout.count());
        return FederationResult(FederationError::DNS_TIMEOUT, "SRV lookup timed out for " + service_name);
    }
    
    out_records = std::move(pending->records);
    LOG_DEBUG("SRV lookup for {} returned {} records", service_name, out_records.size());
    return *pending->outcome;
}

}

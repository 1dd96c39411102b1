#pragma once

#include "fedtrust/federation/federation_error.hpp"
#include "fedtrust/federation/http_client.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace fedtrust::federation {

struct WellKnownResponse {
    std::string server;   // the "m.server" delegation target
    
    bool operator==(const WellKnownResponse&) const = default;
};

class WellKnownClient {
public:
    WellKnownClient(std::shared_ptr<HttpClient> http_client, std::chrono::milliseconds timeout);
    
    // GET https://{hostname}/.well-known/matrix/server. Any failure, including
    // a transport error, means the server publishes no delegation.
    FederationResult fetch(const std::string& hostname, WellKnownResponse& out_response) const;

private:
    std::shared_ptr<HttpClient> http_client_;
    std::chrono::milliseconds timeout_;
};

}

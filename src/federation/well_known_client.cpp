#include "fedtrust/federation/well_known_client.hpp"
#include "fedtrust/core/logger.hpp"
#include "fedtrust/json/canonical_json.hpp"

namespace fedtrust::federation {

WellKnownClient::WellKnownClient(std::shared_ptr<HttpClient> http_client, std::chrono::milliseconds timeout)
    : http_client_(std::move(http_client))
    , timeout_(timeout) {
}

FederationResult WellKnownClient::fetch(const std::string& hostname, WellKnownResponse& out_response) const {
    HttpRequest request;
    request.method = "GET";
    request.url = "https://" + hostname + "/.well-known/matrix/server";
    request.headers.emplace_back("Accept", "application/json");
    request.timeout = timeout_;
    
    HttpResponse response;
    auto result = http_client_->perform(request, response);
    if (!result) {
        return FederationResult(FederationError::WELL_KNOWN_FAILURE,
            "Well-known request for " + hostname + " failed: " + result.message);
    }
    
    if (!response.ok()) {
        return FederationResult(FederationError::WELL_KNOWN_FAILURE,
            "Well-known request for " + hostname + " returned HTTP " + std::to_string(response.status));
    }
    
    auto document = json::try_parse(response.body);
    if (!document || !document->is_object()) {
        return FederationResult(FederationError::WELL_KNOWN_FAILURE,
            "Well-known response for " + hostname + " is not a JSON object");
    }
    
    auto it = document->find("m.server");
    if (it == document->end() || !it->is_string() || it->get<std::string>().empty()) {
        return FederationResult(FederationError::WELL_KNOWN_FAILURE,
            "Well-known response for " + hostname + " has no m.server");
    }
    
    out_response.server = it->get<std::string>();
    LOG_DEBUG("Well-known for {} delegates to {}", hostname, out_response.server);
    return FederationResult();
}

}

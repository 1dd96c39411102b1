#pragma once

#include "fedtrust/events/event.hpp"
#include "fedtrust/federation/federation_error.hpp"
#include "fedtrust/json/canonical_json.hpp"
#include "fedtrust/keys/key_provider.hpp"
#include "fedtrust/signing/request_signer.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fedtrust::signing {

// Inbound verification. Everything received is untrusted: failures are
// reported, never thrown.
class EventVerifier {
public:
    explicit EventVerifier(std::shared_ptr<keys::PublicKeyProvider> key_provider);
    
    // Every expected server must have at least one verifying signature, and
    // hashes.sha256 must match the content hash recomputed locally
    federation::FederationResult validate_event_crypto(
        const events::Event& event,
        const std::vector<std::string>& expected_servers
    ) const;
    
    federation::FederationResult validate_event_crypto(
        const json::Value& event,
        const std::vector<std::string>& expected_servers
    ) const;
    
    // Checks an X-Matrix request signature whose header fields the route
    // layer has already extracted
    federation::FederationResult verify_request(
        const XMatrixAuth& auth,
        const std::string& method,
        const std::string& uri,
        const std::optional<json::Value>& content
    ) const;

private:
    bool verify_signature(
        const std::string& server_name,
        const std::string& key_id,
        const std::string& signature,
        const std::string& message
    ) const;
    
    std::shared_ptr<keys::PublicKeyProvider> key_provider_;
};

}

#include "fedtrust/signing/event_verifier.hpp"
#include "fedtrust/core/logger.hpp"
#include "fedtrust/crypto/signature.hpp"
#include "fedtrust/events/content_hasher.hpp"
#include "fedtrust/signing/event_signer.hpp"

namespace fedtrust::signing {

using federation::FederationError;
using federation::FederationResult;

EventVerifier::EventVerifier(std::shared_ptr<keys::PublicKeyProvider> key_provider)
    : key_provider_(std::move(key_provider)) {
}

bool EventVerifier::verify_signature(
    const std::string& server_name,
    const std::string& key_id,
    const std::string& signature,
    const std::string& message) const {
    
    std::string public_key;
    auto lookup = key_provider_->get_server_public_key(server_name, key_id, public_key);
    if (!lookup) {
        LOG_DEBUG("Cannot verify {} signature {}: {}", server_name, key_id, lookup.describe());
        return false;
    }
    
    crypto::SignatureEngine engine;
    auto result = engine.verify_base64(signature, crypto::as_bytes(message), public_key);
    if (!result) {
        LOG_DEBUG("Signature {} from {} did not verify", key_id, server_name);
        return false;
    }
    return true;
}

FederationResult EventVerifier::validate_event_crypto(
    const events::Event& event,
    const std::vector<std::string>& expected_servers) const {
    
    if (expected_servers.empty()) {
        return FederationResult(FederationError::INVALID_SIGNATURE, "No servers expected to have signed");
    }
    
    std::string message;
    try {
        message = json::encode_canonical(EventSigner::signing_view(event));
    } catch (const json::CanonicalJsonError& e) {
        return FederationResult(FederationError::INVALID_JSON, e.what());
    }
    
    for (const auto& server : expected_servers) {
        auto it = event.signatures.find(server);
        if (it == event.signatures.end() || it->second.empty()) {
            LOG_WARN("Event in {} carries no signature from {}", event.room_id, server);
            return FederationResult(FederationError::INVALID_SIGNATURE, "Missing signature from " + server);
        }
        
        bool verified = false;
        for (const auto& [key_id, signature] : it->second) {
            if (verify_signature(server, key_id, signature, message)) {
                verified = true;
                break;
            }
        }
        
        if (!verified) {
            LOG_WARN("No signature from {} on event in {} verified", server, event.room_id);
            return FederationResult(FederationError::INVALID_SIGNATURE, "No valid signature from " + server);
        }
    }
    
    auto claimed = event.content_hash();
    if (!claimed) {
        return FederationResult(FederationError::CONTENT_HASH_MISMATCH, "Event has no sha256 content hash");
    }
    
    std::string computed;
    try {
        computed = events::ContentHasher::calculate_content_hash(event);
    } catch (const json::CanonicalJsonError& e) {
        return FederationResult(FederationError::INVALID_JSON, e.what());
    }
    
    if (*claimed != computed) {
        LOG_WARN("Content hash mismatch on event in {}: claimed {}, computed {}", event.room_id, *claimed, computed);
        return FederationResult(FederationError::CONTENT_HASH_MISMATCH, "Content hash mismatch");
    }
    
    return FederationResult();
}

FederationResult EventVerifier::validate_event_crypto(
    const json::Value& event,
    const std::vector<std::string>& expected_servers) const {
    
    events::Event parsed;
    try {
        parsed = events::Event::from_json(event);
    } catch (const events::EventFormatError& e) {
        return FederationResult(FederationError::INVALID_JSON, e.what());
    }
    
    return validate_event_crypto(parsed, expected_servers);
}

FederationResult EventVerifier::verify_request(
    const XMatrixAuth& auth,
    const std::string& method,
    const std::string& uri,
    const std::optional<json::Value>& content) const {
    
    if (auth.origin.empty() || auth.key_id.empty() || auth.signature.empty()) {
        return FederationResult(FederationError::INVALID_SIGNATURE, "Incomplete X-Matrix credentials");
    }
    
    std::string message;
    try {
        message = json::encode_canonical(
            RequestSigner::request_object(method, uri, auth.origin, auth.destination, content));
    } catch (const json::CanonicalJsonError& e) {
        return FederationResult(FederationError::INVALID_JSON, e.what());
    }
    
    if (!verify_signature(auth.origin, auth.key_id, auth.signature, message)) {
        LOG_WARN("Rejected {} {} from {}: bad request signature", method, uri, auth.origin);
        return FederationResult(FederationError::INVALID_SIGNATURE, "Request signature from " + auth.origin + " is invalid");
    }
    
    return FederationResult();
}

}

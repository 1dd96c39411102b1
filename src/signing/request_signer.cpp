#include "fedtrust/signing/request_signer.hpp"
#include "fedtrust/core/logger.hpp"
#include "fedtrust/signing/event_signer.hpp"
#include "fedtrust/signing/json_signer.hpp"

namespace fedtrust::signing {

std::string XMatrixAuth::to_header() const {
    return "X-Matrix origin=\"" + origin + "\",destination=\"" + destination +
           "\",key=\"" + key_id + "\",sig=\"" + signature + "\"";
}

RequestSigner::RequestSigner(std::shared_ptr<keys::LocalKeyProvider> key_provider, std::string server_name)
    : key_provider_(std::move(key_provider))
    , server_name_(std::move(server_name)) {
}

json::Value RequestSigner::request_object(
    const std::string& method,
    const std::string& uri,
    const std::string& origin,
    const std::string& destination,
    const std::optional<json::Value>& content) {
    
    json::Value object = {
        {"method", method},
        {"uri", uri},
        {"origin", origin},
        {"destination", destination}
    };
    if (content) {
        object["content"] = *content;
    }
    return object;
}

XMatrixAuth RequestSigner::sign_request(
    const std::string& method,
    const std::string& uri,
    const std::string& destination,
    const std::optional<json::Value>& content) const {
    
    storage::ServerSigningKey key;
    auto result = key_provider_->get_server_signing_key(server_name_, key);
    if (!result) {
        throw SigningError("No signing key for " + server_name_ + ": " + result.describe());
    }
    
    auto seed = decode_signing_seed(key);
    auto object = request_object(method, uri, server_name_, destination, content);
    auto signed_result = JsonSigner::sign_json(object, server_name_, key.key_id, seed.span());
    if (!signed_result) {
        throw SigningError("Failed to sign request: " + signed_result.describe());
    }
    
    XMatrixAuth auth;
    auth.origin = server_name_;
    auth.destination = destination;
    auth.key_id = key.key_id;
    auth.signature = object["signatures"][server_name_][key.key_id].get<std::string>();
    
    LOG_DEBUG("Signed {} {} for {}", method, uri, destination);
    return auth;
}

}

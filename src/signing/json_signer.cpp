#include "fedtrust/signing/json_signer.hpp"
#include "fedtrust/core/logger.hpp"

namespace fedtrust::signing {

const crypto::SignatureEngine& JsonSigner::engine() {
    static const crypto::SignatureEngine instance;
    return instance;
}

std::string JsonSigner::signing_bytes(const json::Value& object) {
    if (!object.is_object()) {
        return json::encode_canonical(object);
    }
    
    json::Value stripped = object;
    stripped.erase("signatures");
    stripped.erase("unsigned");
    return json::encode_canonical(stripped);
}

crypto::CryptoResult JsonSigner::sign_json(
    json::Value& object,
    const std::string& server_name,
    const std::string& key_id,
    std::span<const std::uint8_t> seed) {
    
    if (!object.is_object()) {
        return crypto::CryptoResult(crypto::CryptoError::INVALID_STATE, "Only JSON objects can be signed");
    }
    
    std::string signature;
    auto result = engine().sign_base64(crypto::as_bytes(signing_bytes(object)), seed, signature);
    if (!result) {
        return result;
    }
    
    auto& signatures = object["signatures"];
    if (!signatures.is_object()) {
        signatures = json::Value::object();
    }
    auto& server_signatures = signatures[server_name];
    if (!server_signatures.is_object()) {
        server_signatures = json::Value::object();
    }
    server_signatures[key_id] = signature;
    
    return crypto::CryptoResult();
}

crypto::CryptoResult JsonSigner::verify_json(
    const json::Value& object,
    const std::string& server_name,
    const KeyLookup& lookup) {
    
    using crypto::CryptoError;
    using crypto::CryptoResult;
    
    if (!object.is_object()) {
        return CryptoResult(CryptoError::INVALID_SIGNATURE, "Signed value is not an object");
    }
    
    auto signatures = object.find("signatures");
    if (signatures == object.end() || !signatures->is_object()) {
        return CryptoResult(CryptoError::INVALID_SIGNATURE, "No signatures present");
    }
    
    auto server_signatures = signatures->find(server_name);
    if (server_signatures == signatures->end() || !server_signatures->is_object() ||
        server_signatures->empty()) {
        return CryptoResult(CryptoError::INVALID_SIGNATURE, "No signatures from " + server_name);
    }
    
    std::string message;
    try {
        message = signing_bytes(object);
    } catch (const json::CanonicalJsonError& e) {
        return CryptoResult(CryptoError::INVALID_SIGNATURE, e.what());
    }
    
    for (const auto& [key_id, signature] : server_signatures->items()) {
        if (!signature.is_string()) {
            continue;
        }
        
        auto public_key = lookup(key_id);
        if (!public_key) {
            LOG_DEBUG("No trusted key {} for {}", key_id, server_name);
            continue;
        }
        
        if (engine().verify_base64(signature.get<std::string>(), crypto::as_bytes(message), *public_key)) {
            return CryptoResult();
        }
        
        LOG_DEBUG("Signature {} from {} did not verify", key_id, server_name);
    }
    
    return CryptoResult(CryptoError::INVALID_SIGNATURE, "No valid signature from " + server_name);
}

}

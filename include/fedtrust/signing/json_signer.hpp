#pragma once

#include "fedtrust/crypto/crypto_types.hpp"
#include "fedtrust/crypto/signature.hpp"
#include "fedtrust/json/canonical_json.hpp"
#include <functional>
#include <optional>
#include <span>
#include <string>

namespace fedtrust::signing {

// key_id -> base64 public key, or nullopt when the key cannot be trusted
using KeyLookup = std::function<std::optional<std::string>(const std::string& key_id)>;

class JsonSigner {
public:
    // Canonical bytes of `object` without its "signatures" and "unsigned"
    static std::string signing_bytes(const json::Value& object);
    
    // Signs `object` and merges the signature into
    // object["signatures"][server_name][key_id], keeping every other entry
    static crypto::CryptoResult sign_json(
        json::Value& object,
        const std::string& server_name,
        const std::string& key_id,
        std::span<const std::uint8_t> seed
    );
    
    // Succeeds when at least one of server_name's signatures on `object`
    // verifies with the key `lookup` returns for its key id
    static crypto::CryptoResult verify_json(
        const json::Value& object,
        const std::string& server_name,
        const KeyLookup& lookup
    );

private:
    static const crypto::SignatureEngine& engine();
};

}

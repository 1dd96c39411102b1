#pragma once

#include "fedtrust/crypto/crypto_types.hpp"
#include "fedtrust/events/event.hpp"
#include "fedtrust/json/canonical_json.hpp"
#include "fedtrust/keys/key_provider.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace fedtrust::signing {

// Outbound signing only handles data this server produced itself, so every
// failure is a bug and surfaces as an exception.
class SigningError : public std::runtime_error {
public:
    explicit SigningError(const std::string& what) : std::runtime_error(what) {}
};

// Base64 seed of a local key as raw bytes; throws SigningError
crypto::SecureBytes decode_signing_seed(const storage::ServerSigningKey& key);

class EventSigner {
public:
    EventSigner(std::shared_ptr<keys::LocalKeyProvider> key_provider, std::string server_name);
    
    // Attaches hashes.sha256 and adds this server's signature under key_id,
    // preserving signatures already present
    void sign_event(events::Event& event, const std::string& key_id) const;
    
    // Signs an arbitrary JSON object (key responses, request bodies)
    json::Value sign_json(json::Value object, const std::string& key_id) const;
    
    // The preserved top-level fields with content kept verbatim, minus
    // signatures and unsigned data
    static json::Value signing_view(const events::Event& event);
    
    const std::string& server_name() const { return server_name_; }

private:
    storage::ServerSigningKey load_key(const std::string& key_id) const;
    
    std::shared_ptr<keys::LocalKeyProvider> key_provider_;
    std::string server_name_;
};

}

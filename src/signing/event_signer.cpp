#include "fedtrust/signing/event_signer.hpp"
#include "fedtrust/core/logger.hpp"
#include "fedtrust/crypto/base64.hpp"
#include "fedtrust/events/content_hasher.hpp"
#include "fedtrust/events/redactor.hpp"
#include "fedtrust/signing/json_signer.hpp"

namespace fedtrust::signing {

crypto::SecureBytes decode_signing_seed(const storage::ServerSigningKey& key) {
    if (!key.private_key) {
        throw SigningError("Signing key " + key.key_id + " has no private half");
    }
    
    crypto::SecureBytes seed;
    auto result = crypto::decode_base64(*key.private_key, seed.data);
    
    if (!result || seed.size() != crypto::ED25519_SEED_SIZE) {
        throw SigningError("Signing key " + key.key_id + " is malformed");
    }
    return seed;
}

EventSigner::EventSigner(std::shared_ptr<keys::LocalKeyProvider> key_provider, std::string server_name)
    : key_provider_(std::move(key_provider))
    , server_name_(std::move(server_name)) {
}

storage::ServerSigningKey EventSigner::load_key(const std::string& key_id) const {
    storage::ServerSigningKey key;
    auto result = key_provider_->get_server_signing_key(server_name_, key);
    if (!result) {
        throw SigningError("No signing key for " + server_name_ + ": " + result.describe());
    }
    
    if (key.key_id != key_id) {
        throw SigningError("Requested key " + key_id + " but the active key for " +
                           server_name_ + " is " + key.key_id);
    }
    return key;
}

void EventSigner::sign_event(events::Event& event, const std::string& key_id) const {
    if (event.room_id.empty() || event.sender.empty() || event.event_type.empty()) {
        throw SigningError("Event is missing room_id, sender or type");
    }
    
    auto sender_server = events::server_name_from_id(event.sender);
    if (!sender_server || *sender_server != server_name_) {
        throw SigningError("Refusing to sign event from " + event.sender + " as " + server_name_);
    }
    
    auto key = load_key(key_id);
    auto seed = decode_signing_seed(key);
    
    event.set_content_hash(events::ContentHasher::calculate_content_hash(event));
    
    std::string canonical = json::encode_canonical(signing_view(event));
    
    std::string signature;
    crypto::SignatureEngine engine;
    auto result = engine.sign_base64(crypto::as_bytes(canonical), seed.span(), signature);
    if (!result) {
        throw SigningError("Failed to sign event: " + result.describe());
    }
    
    event.signatures[server_name_][key_id] = signature;
    LOG_DEBUG("Signed {} event in {} with {}", event.event_type, event.room_id, key_id);
}

json::Value EventSigner::sign_json(json::Value object, const std::string& key_id) const {
    auto key = load_key(key_id);
    auto seed = decode_signing_seed(key);
    
    auto result = JsonSigner::sign_json(object, server_name_, key_id, seed.span());
    if (!result) {
        throw SigningError("Failed to sign JSON: " + result.describe());
    }
    return object;
}

json::Value EventSigner::signing_view(const events::Event& event) {
    json::Value wire = event.to_json();
    
    json::Value view = json::Value::object();
    for (auto field : events::Redactor::preserved_fields()) {
        std::string name(field);
        auto it = wire.find(name);
        if (it != wire.end()) {
            view[name] = *it;
        }
    }
    view["content"] = event.content;
    return view;
}

}

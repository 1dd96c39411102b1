#include "fedtrust/events/content_hasher.hpp"
#include "fedtrust/crypto/base64.hpp"
#include "fedtrust/crypto/hash.hpp"
#include "fedtrust/events/redactor.hpp"

namespace fedtrust::events {

namespace {

crypto::Sha256Hash hash_canonical(const json::Value& value) {
    return crypto::hash_utils::hash_string(json::encode_canonical(value));
}

crypto::Sha256Hash reference_digest(const json::Value& event, const RoomVersion& version) {
    json::Value redacted = Redactor::redact(event, version);
    redacted.erase("signatures");
    redacted.erase("unsigned");
    return hash_canonical(redacted);
}

}

std::string ContentHasher::calculate_content_hash(const Event& event) {
    return calculate_content_hash(event.to_json());
}

std::string ContentHasher::calculate_content_hash(const json::Value& event) {
    json::Value stripped = event;
    if (stripped.is_object()) {
        stripped.erase("unsigned");
        stripped.erase("signatures");
        stripped.erase("hashes");
    }
    return crypto::hash_utils::hash_to_base64(hash_canonical(stripped));
}

std::string ContentHasher::calculate_reference_hash(const Event& event, const RoomVersion& version) {
    return calculate_reference_hash(event.to_json(), version);
}

std::string ContentHasher::calculate_reference_hash(const json::Value& event, const RoomVersion& version) {
    return crypto::hash_utils::hash_to_base64(reference_digest(event, version));
}

bool ContentHasher::verify_content_hash(const Event& event) {
    auto claimed = event.content_hash();
    if (!claimed) {
        return false;
    }
    
    return *claimed == calculate_content_hash(event);
}

std::optional<std::string> ContentHasher::compute_event_id(const Event& event, const RoomVersion& version) {
    if (!version.derives_event_id()) {
        return std::nullopt;
    }
    
    json::Value wire = event.to_json();
    wire.erase("event_id");
    
    auto digest = reference_digest(wire, version);
    auto variant = version.uses_url_safe_event_ids()
        ? crypto::Base64Variant::UrlSafe
        : crypto::Base64Variant::Standard;
    
    return "$" + crypto::encode_base64(std::span(digest), variant);
}

}

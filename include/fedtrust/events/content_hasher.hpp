#pragma once

#include "fedtrust/events/event.hpp"
#include "fedtrust/events/room_version.hpp"
#include "fedtrust/json/canonical_json.hpp"
#include <optional>
#include <string>

namespace fedtrust::events {

class ContentHasher {
public:
    // base64(sha256(canonical(event minus unsigned, signatures, hashes))), unpadded
    static std::string calculate_content_hash(const Event& event);
    static std::string calculate_content_hash(const json::Value& event);
    
    // base64(sha256(canonical(redact(event) minus signatures, unsigned))), unpadded
    static std::string calculate_reference_hash(const Event& event, const RoomVersion& version);
    static std::string calculate_reference_hash(const json::Value& event, const RoomVersion& version);
    
    // False when hashes.sha256 is absent or differs from a fresh computation
    static bool verify_content_hash(const Event& event);
    
    // "$" + reference hash. Versions 1 and 2 have no derived id.
    static std::optional<std::string> compute_event_id(const Event& event, const RoomVersion& version);
};

}

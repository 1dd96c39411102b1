#include "fedtrust/keys/verify_key_bundle.hpp"
#include <cstdint>
#include <limits>

namespace fedtrust::keys {

using federation::FederationError;
using federation::FederationResult;

namespace {

// An integer that survives get<std::int64_t>() unchanged
bool is_timestamp(const json::Value& value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    }
    return value.is_number_integer();
}

}

FederationResult VerifyKeyBundle::from_json(const json::Value& value, VerifyKeyBundle& out) {
    if (!value.is_object()) {
        return FederationResult(FederationError::INVALID_RESPONSE, "Key response is not an object");
    }
    
    VerifyKeyBundle bundle;
    
    auto server_name = value.find("server_name");
    if (server_name == value.end() || !server_name->is_string()) {
        return FederationResult(FederationError::INVALID_RESPONSE, "Key response has no server_name");
    }
    bundle.server_name = server_name->get<std::string>();
    
    auto valid_until = value.find("valid_until_ts");
    if (valid_until == value.end() || !valid_until->is_number_integer()) {
        return FederationResult(FederationError::INVALID_RESPONSE, "Key response has no valid_until_ts");
    }
    if (!is_timestamp(*valid_until)) {
        return FederationResult(FederationError::INVALID_RESPONSE, "Key response valid_until_ts is out of range");
    }
    bundle.valid_until_ts = valid_until->get<std::int64_t>();
    
    auto verify_keys = value.find("verify_keys");
    if (verify_keys == value.end() || !verify_keys->is_object()) {
        return FederationResult(FederationError::INVALID_RESPONSE, "Key response has no verify_keys");
    }
    for (const auto& [key_id, entry] : verify_keys->items()) {
        if (!entry.is_object() || !entry.contains("key") || !entry.at("key").is_string()) {
            return FederationResult(FederationError::INVALID_RESPONSE, "Malformed verify key " + key_id);
        }
        bundle.verify_keys[key_id] = entry.at("key").get<std::string>();
    }
    
    auto old_keys = value.find("old_verify_keys");
    if (old_keys != value.end() && old_keys->is_object()) {
        for (const auto& [key_id, entry] : old_keys->items()) {
            if (!entry.is_object() || !entry.contains("key") || !entry.at("key").is_string()) {
                continue;
            }
            OldVerifyKey old_key;
            old_key.key = entry.at("key").get<std::string>();
            if (entry.contains("expired_ts") && is_timestamp(entry.at("expired_ts"))) {
                old_key.expired_ts = entry.at("expired_ts").get<std::int64_t>();
            }
            bundle.old_verify_keys[key_id] = std::move(old_key);
        }
    }
    
    auto signatures = value.find("signatures");
    if (signatures == value.end()) {
        return FederationResult(FederationError::INVALID_RESPONSE, "Key response is unsigned");
    }
    try {
        bundle.signatures = events::signatures_from_json(*signatures);
    } catch (const events::EventFormatError& e) {
        return FederationResult(FederationError::INVALID_RESPONSE, e.what());
    }
    
    bundle.raw = value;
    out = std::move(bundle);
    return FederationResult();
}

}

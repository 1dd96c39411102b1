#pragma once

#include "fedtrust/events/event.hpp"
#include "fedtrust/federation/federation_error.hpp"
#include "fedtrust/json/canonical_json.hpp"
#include <cstdint>
#include <map>
#include <string>

namespace fedtrust::keys {

struct OldVerifyKey {
    std::string key;
    std::int64_t expired_ts = 0;
};

// A /_matrix/key/v2/server response. The received document is kept in
// `raw` so the signature check covers every field that was signed, unknown
// ones included.
struct VerifyKeyBundle {
    std::string server_name;
    std::map<std::string, std::string> verify_keys;      // key id -> base64 key
    std::map<std::string, OldVerifyKey> old_verify_keys;
    std::int64_t valid_until_ts = 0;
    events::SignatureMap signatures;
    json::Value raw;
    
    static federation::FederationResult from_json(const json::Value& value, VerifyKeyBundle& out);
};

}

#pragma once

#include "fedtrust/json/canonical_json.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace fedtrust::events {

class EventFormatError : public std::runtime_error {
public:
    explicit EventFormatError(const std::string& what) : std::runtime_error(what) {}
};

// server name -> key id -> base64 signature
using SignatureMap = std::map<std::string, std::map<std::string, std::string>>;

// A persistent data unit as exchanged over federation. Anything else found at
// the top level of a received event is kept in `extra` so that hashing sees
// exactly what was sent.
struct Event {
    std::string event_id;            // empty for room versions that derive it
    std::string room_id;
    std::string sender;
    std::string event_type;          // "type" on the wire
    json::Value content = json::Value::object();
    std::int64_t origin_server_ts = 0;
    json::Value prev_events = json::Value::array();
    json::Value auth_events = json::Value::array();
    std::int64_t depth = 0;
    std::optional<std::string> state_key;
    std::optional<json::Value> hashes;
    SignatureMap signatures;
    std::optional<json::Value> unsigned_data;
    json::Value extra = json::Value::object();
    
    static Event from_json(const json::Value& value);
    json::Value to_json() const;
    
    std::optional<std::string> content_hash() const;
    void set_content_hash(const std::string& hash);
};

// "@alice:example.org" -> "example.org"; the server part may carry a port
std::optional<std::string> server_name_from_id(const std::string& id);

json::Value signatures_to_json(const SignatureMap& signatures);
SignatureMap signatures_from_json(const json::Value& value);

}

#include "fedtrust/events/event.hpp"

namespace fedtrust::events {

namespace {

const json::Value& require(const json::Value& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw EventFormatError(std::string("Event is missing '") + key + "'");
    }
    return *it;
}

std::string require_string(const json::Value& object, const char* key) {
    const auto& value = require(object, key);
    if (!value.is_string()) {
        throw EventFormatError(std::string("Event field '") + key + "' must be a string");
    }
    return value.get<std::string>();
}

std::int64_t require_integer(const json::Value& object, const char* key) {
    const auto& value = require(object, key);
    if (!value.is_number_integer()) {
        throw EventFormatError(std::string("Event field '") + key + "' must be an integer");
    }
    return value.get<std::int64_t>();
}

const char* const known_fields[] = {
    "event_id", "room_id", "sender", "type", "content", "origin_server_ts",
    "prev_events", "auth_events", "depth", "state_key", "hashes", "signatures", "unsigned"
};

bool is_known_field(const std::string& key) {
    for (const char* field : known_fields) {
        if (key == field) return true;
    }
    return false;
}

}

Event Event::from_json(const json::Value& value) {
    if (!value.is_object()) {
        throw EventFormatError("Event must be a JSON object");
    }
    
    Event event;
    event.room_id = require_string(value, "room_id");
    event.sender = require_string(value, "sender");
    event.event_type = require_string(value, "type");
    event.origin_server_ts = require_integer(value, "origin_server_ts");
    event.depth = require_integer(value, "depth");
    
    event.content = require(value, "content");
    if (!event.content.is_object()) {
        throw EventFormatError("Event content must be an object");
    }
    
    event.prev_events = require(value, "prev_events");
    event.auth_events = require(value, "auth_events");
    if (!event.prev_events.is_array() || !event.auth_events.is_array()) {
        throw EventFormatError("prev_events and auth_events must be arrays");
    }
    
    if (value.contains("event_id")) {
        event.event_id = require_string(value, "event_id");
    }
    if (value.contains("state_key")) {
        event.state_key = require_string(value, "state_key");
    }
    if (value.contains("hashes")) {
        event.hashes = value.at("hashes");
        if (!event.hashes->is_object()) {
            throw EventFormatError("Event hashes must be an object");
        }
    }
    if (value.contains("signatures")) {
        event.signatures = signatures_from_json(value.at("signatures"));
    }
    if (value.contains("unsigned")) {
        event.unsigned_data = value.at("unsigned");
    }
    
    for (const auto& [key, field] : value.items()) {
        if (!is_known_field(key)) {
            event.extra[key] = field;
        }
    }
    
    return event;
}

json::Value Event::to_json() const {
    json::Value value = extra.is_object() ? extra : json::Value::object();
    
    if (!event_id.empty()) {
        value["event_id"] = event_id;
    }
    value["room_id"] = room_id;
    value["sender"] = sender;
    value["type"] = event_type;
    value["content"] = content;
    value["origin_server_ts"] = origin_server_ts;
    value["prev_events"] = prev_events;
    value["auth_events"] = auth_events;
    value["depth"] = depth;
    
    if (state_key) {
        value["state_key"] = *state_key;
    }
    if (hashes) {
        value["hashes"] = *hashes;
    }
    if (!signatures.empty()) {
        value["signatures"] = signatures_to_json(signatures);
    }
    if (unsigned_data) {
        value["unsigned"] = *unsigned_data;
    }
    
    return value;
}

std::optional<std::string> Event::content_hash() const {
    if (!hashes || !hashes->is_object()) {
        return std::nullopt;
    }
    
    auto it = hashes->find("sha256");
    if (it == hashes->end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

void Event::set_content_hash(const std::string& hash) {
    if (!hashes || !hashes->is_object()) {
        hashes = json::Value::object();
    }
    (*hashes)["sha256"] = hash;
}

std::optional<std::string> server_name_from_id(const std::string& id) {
    auto pos = id.find(':');
    if (pos == std::string::npos || pos + 1 >= id.size()) {
        return std::nullopt;
    }
    return id.substr(pos + 1);
}

json::Value signatures_to_json(const SignatureMap& signatures) {
    json::Value value = json::Value::object();
    for (const auto& [server, keys] : signatures) {
        json::Value& server_entry = value[server];
        server_entry = json::Value::object();
        for (const auto& [key_id, signature] : keys) {
            server_entry[key_id] = signature;
        }
    }
    return value;
}

SignatureMap signatures_from_json(const json::Value& value) {
    if (!value.is_object()) {
        throw EventFormatError("signatures must be an object");
    }
    
    SignatureMap signatures;
    for (const auto& [server, keys] : value.items()) {
        if (!keys.is_object()) {
            throw EventFormatError("signatures for " + server + " must be an object");
        }
        auto& entry = signatures[server];
        for (const auto& [key_id, signature] : keys.items()) {
            if (!signature.is_string()) {
                throw EventFormatError("signature " + key_id + " for " + server + " must be a string");
            }
            entry[key_id] = signature.get<std::string>();
        }
    }
    return signatures;
}

}

#include "fedtrust/events/redactor.hpp"

namespace fedtrust::events {

EventKind event_kind(std::string_view event_type) {
    if (event_type == "m.room.member") return EventKind::Member;
    if (event_type == "m.room.create") return EventKind::Create;
    if (event_type == "m.room.join_rules") return EventKind::JoinRules;
    if (event_type == "m.room.power_levels") return EventKind::PowerLevels;
    if (event_type == "m.room.history_visibility") return EventKind::HistoryVisibility;
    if (event_type == "m.room.aliases") return EventKind::Aliases;
    if (event_type == "m.room.redaction") return EventKind::Redaction;
    return EventKind::Other;
}

ContentPolicy content_policy(EventKind kind, const RoomVersion& version) {
    const int v = version.rules();
    
    switch (kind) {
        case EventKind::Member:
            if (v <= 8) return {false, {"membership"}};
            return {false, {"membership", "join_authorised_via_users_server"}};
        
        case EventKind::Create:
            if (v <= 10) return {false, {"creator", "m.federate", "room_version"}};
            return {true, {}};
        
        case EventKind::JoinRules:
            if (v <= 8) return {false, {"join_rule"}};
            return {false, {"join_rule", "allow"}};
        
        case EventKind::PowerLevels:
            if (v <= 10) {
                return {false, {"ban", "events", "events_default", "kick", "redact",
                                "state_default", "users", "users_default"}};
            }
            return {false, {"ban", "events", "events_default", "invite", "kick", "redact",
                            "state_default", "users", "users_default"}};
        
        case EventKind::HistoryVisibility:
            return {false, {"history_visibility"}};
        
        case EventKind::Aliases:
            if (v <= 5) return {false, {"aliases"}};
            return {false, {}};
        
        case EventKind::Redaction:
            if (v == 11) return {false, {"redacts"}};
            return {false, {}};
        
        case EventKind::Other:
            return {false, {}};
    }
    
    return {false, {}};
}

const std::vector<std::string_view>& Redactor::preserved_fields() {
    static const std::vector<std::string_view> fields = {
        "event_id", "type", "room_id", "sender", "origin_server_ts",
        "depth", "prev_events", "auth_events", "state_key", "hashes"
    };
    return fields;
}

json::Value Redactor::redact(const json::Value& event, const RoomVersion& version) {
    json::Value redacted = json::Value::object();
    if (!event.is_object()) {
        return redacted;
    }
    
    for (auto field : preserved_fields()) {
        std::string name(field);
        auto it = event.find(name);
        if (it != event.end()) {
            redacted[name] = *it;
        }
    }
    
    auto content_it = event.find("content");
    if (content_it == event.end() || !content_it->is_object()) {
        return redacted;
    }
    
    std::string event_type;
    if (auto type_it = event.find("type"); type_it != event.end() && type_it->is_string()) {
        event_type = type_it->get<std::string>();
    }
    
    auto policy = content_policy(event_kind(event_type), version);
    
    json::Value content = json::Value::object();
    if (policy.keep_all) {
        content = *content_it;
    } else {
        for (auto key : policy.keys) {
            std::string name(key);
            auto it = content_it->find(name);
            if (it != content_it->end()) {
                content[name] = *it;
            }
        }
    }
    
    if (!content.empty()) {
        redacted["content"] = std::move(content);
    }
    
    return redacted;
}

json::Value Redactor::redact(const Event& event, const RoomVersion& version) {
    return redact(event.to_json(), version);
}

}

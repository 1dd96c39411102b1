#pragma once

#include "fedtrust/events/event.hpp"
#include "fedtrust/events/room_version.hpp"
#include "fedtrust/json/canonical_json.hpp"
#include <string_view>
#include <vector>

namespace fedtrust::events {

// Event types whose content survives redaction in some room version
enum class EventKind {
    Member,
    Create,
    JoinRules,
    PowerLevels,
    HistoryVisibility,
    Aliases,
    Redaction,
    Other
};

EventKind event_kind(std::string_view event_type);

struct ContentPolicy {
    bool keep_all = false;
    std::vector<std::string_view> keys;
};

ContentPolicy content_policy(EventKind kind, const RoomVersion& version);

class Redactor {
public:
    // Top-level fields that survive redaction when present
    static const std::vector<std::string_view>& preserved_fields();
    
    static json::Value redact(const json::Value& event, const RoomVersion& version);
    static json::Value redact(const Event& event, const RoomVersion& version);
};

}

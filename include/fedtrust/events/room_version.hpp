#pragma once

#include <string>
#include <string_view>

namespace fedtrust::events {

constexpr int NEWEST_ROOM_VERSION = 11;

// Room versions are opaque strings on the wire. Versions this code does not
// recognise (non-numeric, experimental, or newer than NEWEST_ROOM_VERSION)
// follow the newest known rules.
class RoomVersion {
public:
    static RoomVersion parse(std::string_view id);
    static RoomVersion newest() { return RoomVersion(std::to_string(NEWEST_ROOM_VERSION), NEWEST_ROOM_VERSION, true); }
    
    const std::string& id() const { return id_; }
    int rules() const { return rules_; }
    bool is_known() const { return known_; }
    
    // v1 and v2 carry origin-assigned event ids; later versions derive them
    bool derives_event_id() const { return rules_ >= 3; }
    bool uses_url_safe_event_ids() const { return rules_ >= 4; }

private:
    RoomVersion(std::string id, int rules, bool known)
        : id_(std::move(id)), rules_(rules), known_(known) {}
    
    std::string id_;
    int rules_;
    bool known_;
};

}

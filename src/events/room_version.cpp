#include "fedtrust/events/room_version.hpp"
#include "fedtrust/core/logger.hpp"
#include <charconv>

namespace fedtrust::events {

RoomVersion RoomVersion::parse(std::string_view id) {
    int number = 0;
    auto [end, ec] = std::from_chars(id.data(), id.data() + id.size(), number);
    
    if (ec == std::errc() && end == id.data() + id.size() &&
        number >= 1 && number <= NEWEST_ROOM_VERSION && id.front() != '0') {
        return RoomVersion(std::string(id), number, true);
    }
    
    LOG_DEBUG("Unrecognised room version '{}', applying version {} rules", id, NEWEST_ROOM_VERSION);
    return RoomVersion(std::string(id), NEWEST_ROOM_VERSION, false);
}

}

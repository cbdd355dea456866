#include "realtime_bridge/session/call_profile.hpp"

#include "realtime_bridge/utils/text.hpp"

namespace realtime_bridge {

CallDirection parse_direction(const std::string& value) {
    const auto normalized = utils::normalize_text(value);
    if (normalized == "outbound" || normalized == "outbound-api" ||
        normalized == "outbound-dial") {
        return CallDirection::Outbound;
    }
    return CallDirection::Inbound;
}

const char* direction_name(CallDirection direction) {
    switch (direction) {
        case CallDirection::Inbound:
            return "inbound";
        case CallDirection::Outbound:
            return "outbound";
    }
    return "unknown";
}

}

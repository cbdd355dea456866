#pragma once

#include <string>

namespace realtime_bridge {

enum class CallDirection {
    Inbound,
    Outbound
};

CallDirection parse_direction(const std::string& value);
const char* direction_name(CallDirection direction);

// Supplied once when the session starts and never changed afterwards.
struct CallProfile {
    std::string call_id;
    CallDirection direction = CallDirection::Inbound;
    std::string instructions;
    std::string voice;
    std::string caller;
    std::string callee;
};

}

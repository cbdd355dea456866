#pragma once

#include <stdexcept>
#include <string>

namespace realtime_bridge {

class ChannelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Handshake failed or did not complete within the open timeout.
class ChannelConnectError : public ChannelError {
public:
    using ChannelError::ChannelError;
};

// The peer sent something that is not a valid event.
class ChannelProtocolError : public ChannelError {
public:
    using ChannelError::ChannelError;
};

}

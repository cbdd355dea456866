#pragma once

#include <memory>
#include <thread>

#include <httplib.h>

#include "realtime_bridge/config.hpp"
#include "realtime_bridge/session/session_registry.hpp"

namespace realtime_bridge {

// Operational HTTP surface: /health, /metrics and live session snapshots.
class RestServer {
public:
    RestServer(const Config& config, SessionRegistry& registry);

    void start();
    void stop();

private:
    const Config& config_;
    SessionRegistry& registry_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}

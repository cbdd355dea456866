#include "realtime_bridge/app.hpp"
#include "realtime_bridge/config.hpp"
#include "realtime_bridge/logging.hpp"

#include <csignal>

namespace {

realtime_bridge::BridgeApp* g_app = nullptr;

void handle_signal(int) {
    if (g_app) {
        g_app->stop();
    }
}

}

int main() {
    try {
        const auto config = realtime_bridge::Config::load();
        config.validate();
        realtime_bridge::logging::init(config);
        realtime_bridge::info(
            "Starting realtime-bridge",
            {realtime_bridge::kv("realtime_url", config.realtime_url),
             realtime_bridge::kv("media_stream_port", config.media_stream_port),
             realtime_bridge::kv("rest_port", config.rest_api_port),
             realtime_bridge::kv("sip_enabled", config.sip_enabled),
             realtime_bridge::kv("encoding", config.audio_encoding)});
        realtime_bridge::BridgeApp app(config);
        g_app = &app;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
        app.init();
        app.run();
        g_app = nullptr;
    } catch (const std::exception& ex) {
        realtime_bridge::error(
            "Startup failed",
            {realtime_bridge::kv("error", ex.what())});
        return 1;
    }
    return 0;
}

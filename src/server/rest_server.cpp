#include "realtime_bridge/server/rest_server.hpp"

#include <nlohmann/json.hpp>

#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/metrics.hpp"

namespace realtime_bridge {

RestServer::RestServer(const Config& config, SessionRegistry& registry)
    : config_(config),
      registry_(registry) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{
            {"status", "ok"},
            {"active_sessions", registry_.size()}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Get("/sessions", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"sessions", registry_.snapshots()}};
        res.set_content(payload.dump(), "application/json");
    });

    server_->Get(R"(/sessions/([A-Za-z0-9_.@:-]+))",
                 [this](const httplib::Request& req, httplib::Response& res) {
        const auto call_id = req.matches[1].str();
        auto session = registry_.find(call_id);
        if (!session) {
            res.status = 404;
            res.set_content(R"({"message":"session not found"})", "application/json");
            return;
        }
        nlohmann::json payload = session->snapshot();
        res.set_content(payload.dump(), "application/json");
    });

    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("port", config_.rest_api_port)});
        if (!server_->listen("0.0.0.0", config_.rest_api_port)) {
            logging::error("REST server failed to listen", {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

}

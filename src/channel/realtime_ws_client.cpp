#include "realtime_bridge/channel/realtime_ws_client.hpp"

#include <boost/asio/ssl.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "realtime_bridge/channel/errors.hpp"
#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/metrics.hpp"

namespace realtime_bridge {

namespace {

using WsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using SslContext = boost::asio::ssl::context;

}

struct RealtimeWsClient::WsState {
    WsClient client;
    websocketpp::connection_hdl connection;
};

RealtimeWsClient::RealtimeWsClient(RealtimeOptions options)
    : options_(std::move(options)) {}

RealtimeWsClient::~RealtimeWsClient() {
    on_close_ = nullptr;
    close();
}

void RealtimeWsClient::connect(const CallProfile& profile,
                               EventHandler on_event,
                               CloseHandler on_close) {
    if (running_.exchange(true)) {
        return;
    }
    profile_ = profile;
    on_event_ = std::move(on_event);
    on_close_ = std::move(on_close);

    auto state = std::make_unique<WsState>();
    auto& client = state->client;
    client.clear_access_channels(websocketpp::log::alevel::all);
    client.clear_error_channels(websocketpp::log::elevel::all);
    client.init_asio();

    client.set_tls_init_handler([](websocketpp::connection_hdl) {
        auto ctx = std::make_shared<SslContext>(SslContext::tlsv12_client);
        ctx->set_options(SslContext::default_workarounds |
                         SslContext::no_sslv2 |
                         SslContext::no_sslv3 |
                         SslContext::single_dh_use);
        ctx->set_default_verify_paths();
        return ctx;
    });
    client.set_open_handler([this](websocketpp::connection_hdl) {
        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            open_ = true;
        }
        open_cv_.notify_all();
        logging::info("Realtime channel open", {kv("call_id", profile_.call_id)});
        send_json(realtime_events::session_update(options_, profile_));
        if (profile_.direction == CallDirection::Inbound) {
            // Inbound callers hear the greeting first.
            send_json(realtime_events::response_create());
        }
        schedule_ping();
    });
    client.set_message_handler([this](websocketpp::connection_hdl, WsClient::message_ptr msg) {
        handle_message(msg->get_payload());
    });
    client.set_fail_handler([this](websocketpp::connection_hdl hdl) {
        std::string reason = "connect failed";
        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            if (ws_state_) {
                websocketpp::lib::error_code ec;
                auto con = ws_state_->client.get_con_from_hdl(hdl, ec);
                if (!ec && con) {
                    reason = con->get_ec().message();
                }
            }
            failed_ = true;
            fail_reason_ = reason;
        }
        // connect() reports the failure to its caller.
        open_cv_.notify_all();
    });
    client.set_close_handler([this](websocketpp::connection_hdl) {
        notify_closed("closed by peer");
    });
    client.set_pong_timeout_handler([this](websocketpp::connection_hdl hdl, std::string) {
        logging::warn("Realtime channel pong timeout", {kv("call_id", profile_.call_id)});
        Metrics::instance().increment_event("realtime_pong_timeout");
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_) {
            websocketpp::lib::error_code ec;
            ws_state_->client.close(hdl, websocketpp::close::status::going_away,
                                    "pong timeout", ec);
        }
    });

    websocketpp::lib::error_code ec;
    auto con = client.get_connection(options_.url, ec);
    if (ec) {
        running_ = false;
        throw ChannelConnectError("invalid realtime url: " + ec.message());
    }
    con->replace_header("Authorization", "Bearer " + options_.api_key);
    con->replace_header("OpenAI-Beta", "realtime=v1");
    con->set_open_handshake_timeout(options_.open_timeout.count());
    con->set_pong_timeout(options_.pong_timeout.count());
    state->connection = con->get_handle();
    client.connect(con);

    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        ws_state_ = std::move(state);
    }
    worker_ = std::thread([this]() {
        try {
            ws_state_->client.run();
        } catch (const std::exception& ex) {
            logging::error(
                "Realtime channel loop failed",
                {kv("call_id", profile_.call_id),
                 kv("error", ex.what())});
            notify_closed(ex.what());
        }
    });

    std::unique_lock<std::mutex> lock(ws_mutex_);
    const bool settled = open_cv_.wait_for(lock, options_.open_timeout, [this]() {
        return open_ || failed_;
    });
    if (open_) {
        return;
    }
    const auto reason = settled ? fail_reason_ : std::string("open timeout");
    lock.unlock();
    Metrics::instance().increment_event("realtime_connect_failed");
    close();
    throw ChannelConnectError("realtime connect failed: " + reason);
}

void RealtimeWsClient::send_audio(const std::vector<uint8_t>& payload) {
    send_json(realtime_events::audio_append(payload));
}

void RealtimeWsClient::request_cancel(const std::string& turn_id) {
    logging::debug(
        "Sending response cancel",
        {kv("call_id", profile_.call_id),
         kv("turn_id", turn_id)});
    send_json(realtime_events::response_cancel(turn_id));
}

void RealtimeWsClient::request_checkin(const std::string& text) {
    send_json(realtime_events::system_message(text));
    send_json(realtime_events::response_create());
}

void RealtimeWsClient::close() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_ && !ws_state_->connection.expired()) {
            websocketpp::lib::error_code ec;
            ws_state_->client.close(ws_state_->connection,
                                    websocketpp::close::status::normal,
                                    "call ended", ec);
        }
        if (ws_state_) {
            ws_state_->client.stop();
        }
    }
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

void RealtimeWsClient::send_json(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (!ws_state_ || !open_ || ws_state_->connection.expired()) {
        return;
    }
    websocketpp::lib::error_code ec;
    ws_state_->client.send(ws_state_->connection, payload.dump(),
                           websocketpp::frame::opcode::text, ec);
    if (ec) {
        throw ChannelError("realtime send failed: " + ec.message());
    }
}

void RealtimeWsClient::handle_message(const std::string& payload) {
    try {
        const auto message = nlohmann::json::parse(payload);
        const auto event = realtime_events::parse(message);
        if (event && on_event_) {
            on_event_(*event);
        }
    } catch (const std::exception& ex) {
        Metrics::instance().increment_event("realtime_protocol_error");
        logging::warn(
            "Realtime message ignored",
            {kv("call_id", profile_.call_id),
             kv("error", ex.what())});
    }
}

void RealtimeWsClient::schedule_ping() {
    if (options_.ping_interval.count() <= 0 || !running_) {
        return;
    }
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (!ws_state_) {
        return;
    }
    ws_state_->client.set_timer(
        options_.ping_interval.count(),
        [this](const websocketpp::lib::error_code& timer_ec) {
            if (timer_ec || !running_) {
                return;
            }
            {
                std::lock_guard<std::mutex> ping_lock(ws_mutex_);
                if (!ws_state_ || ws_state_->connection.expired()) {
                    return;
                }
                websocketpp::lib::error_code ec;
                ws_state_->client.ping(ws_state_->connection, "", ec);
            }
            schedule_ping();
        });
}

void RealtimeWsClient::notify_closed(const std::string& reason) {
    if (close_notified_.exchange(true)) {
        return;
    }
    logging::info(
        "Realtime channel closed",
        {kv("call_id", profile_.call_id),
         kv("reason", reason)});
    if (on_close_ && running_) {
        on_close_(reason);
    }
}

}

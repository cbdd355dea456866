#include "realtime_bridge/server/media_stream_server.hpp"

#include <chrono>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/metrics.hpp"
#include "realtime_bridge/utils/async.hpp"

namespace realtime_bridge {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;

}

struct MediaStreamServer::ServerState {
    WsServer server;
};

MediaStreamServer::MediaStreamServer(int port, SessionRegistry& registry, SessionFactory factory)
    : port_(port),
      registry_(registry),
      factory_(std::move(factory)) {}

MediaStreamServer::~MediaStreamServer() {
    stop();
}

void MediaStreamServer::start() {
    state_ = std::make_unique<ServerState>();
    auto& server = state_->server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_open_handler([](websocketpp::connection_hdl) {
        Metrics::instance().increment_event("media_stream_opened");
    });
    server.set_message_handler([this](websocketpp::connection_hdl hdl, WsServer::message_ptr msg) {
        handle_message(hdl, msg->get_payload());
    });
    server.set_close_handler([this](websocketpp::connection_hdl hdl) {
        finish_stream(hdl, "telephony_disconnected");
    });
    server.set_fail_handler([this](websocketpp::connection_hdl hdl) {
        finish_stream(hdl, "telephony_failed");
    });

    server.listen(static_cast<uint16_t>(port_));
    server.start_accept();
    server_thread_ = std::thread([this]() {
        logging::info("Media stream server listening", {kv("port", port_)});
        try {
            state_->server.run();
        } catch (const std::exception& ex) {
            logging::error("Media stream server failed", {kv("error", ex.what())});
        }
    });
}

void MediaStreamServer::stop() {
    if (!state_) {
        return;
    }
    websocketpp::lib::error_code ec;
    state_->server.stop_listening(ec);
    std::map<Handle, std::shared_ptr<Stream>, std::owner_less<Handle>> streams;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams.swap(streams_);
    }
    for (auto& entry : streams) {
        if (entry.second->session) {
            registry_.remove(entry.second->call_id);
            entry.second->session->teardown("shutdown");
        }
        close_connection(entry.first, "shutdown");
    }
    state_->server.stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    state_.reset();
}

void MediaStreamServer::handle_message(const Handle& hdl, const std::string& payload) {
    telephony::StreamMessage message;
    try {
        message = telephony::parse_stream_message(payload);
    } catch (const std::exception& ex) {
        Metrics::instance().increment_event("media_stream_protocol_error");
        logging::warn("Media stream message ignored", {kv("error", ex.what())});
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    switch (message.kind) {
        case telephony::StreamMessage::Kind::Connected:
            logging::debug("Media stream connected");
            return;
        case telephony::StreamMessage::Kind::Start:
            handle_start(hdl, message);
            return;
        case telephony::StreamMessage::Kind::Media: {
            if (message.track != "inbound") {
                return;
            }
            auto stream = find_stream(hdl);
            if (stream && stream->session) {
                stream->session->on_inbound_frame(message.payload, now);
            }
            return;
        }
        case telephony::StreamMessage::Kind::Mark: {
            auto stream = find_stream(hdl);
            if (stream && stream->leg->acknowledge_mark(message.mark_name)) {
                stream->session->on_playback_mark(message.mark_name, now);
            }
            return;
        }
        case telephony::StreamMessage::Kind::Stop:
            finish_stream(hdl, "stream_stopped");
            close_connection(hdl, "stream stopped");
            return;
        case telephony::StreamMessage::Kind::Unknown:
            logging::trace("Media stream event ignored", {kv("event", message.event)});
            return;
    }
}

void MediaStreamServer::handle_start(const Handle& hdl, const telephony::StreamMessage& message) {
    if (find_stream(hdl)) {
        logging::warn("Duplicate media stream start ignored", {kv("stream_sid", message.stream_sid)});
        return;
    }
    if (!message.media_encoding.empty() && message.media_encoding != "audio/x-mulaw") {
        logging::error(
            "Unsupported media stream encoding",
            {kv("stream_sid", message.stream_sid),
             kv("encoding", message.media_encoding)});
        close_connection(hdl, "unsupported encoding");
        return;
    }

    auto stream = std::make_shared<Stream>();
    const auto profile = telephony::make_call_profile(message);
    stream->call_id = profile.call_id;
    stream->leg = std::make_shared<telephony::MediaStreamLeg>(
        message.stream_sid,
        [this, hdl](const std::string& text) { send_text(hdl, text); },
        [this, hdl](const std::string& reason) { close_connection(hdl, reason); });

    try {
        stream->session = factory_(profile, stream->leg);
    } catch (const std::exception& ex) {
        logging::error(
            "Failed to create call session",
            {kv("call_id", profile.call_id),
             kv("error", ex.what())});
        close_connection(hdl, "session setup failed");
        return;
    }
    if (!registry_.add(stream->session)) {
        close_connection(hdl, "session rejected");
        return;
    }
    stream->session->set_on_teardown(
        [this, hdl](const std::string&, const std::string& reason) {
            close_connection(hdl, reason);
        });
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_[hdl] = stream;
    }
    logging::info(
        "Media stream started",
        {kv("call_id", profile.call_id),
         kv("stream_sid", message.stream_sid),
         kv("direction", direction_name(profile.direction))});

    // Connecting to the realtime vendor blocks; keep the socket thread free.
    auto session = stream->session;
    utils::run_async([session]() { session->start(); });
}

void MediaStreamServer::finish_stream(const Handle& hdl, const std::string& reason) {
    std::shared_ptr<Stream> stream;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        auto it = streams_.find(hdl);
        if (it == streams_.end()) {
            return;
        }
        stream = std::move(it->second);
        streams_.erase(it);
    }
    registry_.remove(stream->call_id);
    if (stream->session) {
        stream->session->teardown(reason);
    }
    logging::info(
        "Media stream finished",
        {kv("call_id", stream->call_id),
         kv("reason", reason),
         kv("frames_sent", stream->leg->frames_sent())});
}

void MediaStreamServer::close_connection(const Handle& hdl, const std::string& reason) {
    if (!state_) {
        return;
    }
    websocketpp::lib::error_code ec;
    state_->server.close(hdl, websocketpp::close::status::normal, reason, ec);
    if (ec) {
        logging::debug("Media stream close skipped", {kv("error", ec.message())});
    }
}

void MediaStreamServer::send_text(const Handle& hdl, const std::string& text) {
    if (!state_) {
        return;
    }
    websocketpp::lib::error_code ec;
    state_->server.send(hdl, text, websocketpp::frame::opcode::text, ec);
    if (ec) {
        logging::trace("Media stream send failed", {kv("error", ec.message())});
    }
}

std::shared_ptr<MediaStreamServer::Stream> MediaStreamServer::find_stream(const Handle& hdl) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = streams_.find(hdl);
    if (it == streams_.end()) {
        return nullptr;
    }
    return it->second;
}

}

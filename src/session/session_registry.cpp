#include "realtime_bridge/session/session_registry.hpp"

#include "realtime_bridge/logging.hpp"

namespace realtime_bridge {

void to_json(nlohmann::json& j, const SessionSnapshot& snapshot) {
    j = nlohmann::json{
        {"call_id", snapshot.call_id},
        {"direction", direction_name(snapshot.direction)},
        {"current_turn_id", nullptr},
        {"current_turn_status", nullptr},
        {"hangup_state", hangup_state_name(snapshot.hangup_state)},
        {"ai_speaking", snapshot.ai_speaking},
        {"caller_has_spoken", snapshot.caller_has_spoken},
        {"turns", snapshot.turns},
        {"frames_sent", snapshot.frames_sent},
        {"barge_ins", snapshot.barge_ins},
        {"queued_frames", snapshot.queued_frames},
        {"age_ms", snapshot.age_ms}};
    if (snapshot.current_turn_id) {
        j["current_turn_id"] = *snapshot.current_turn_id;
        j["current_turn_status"] = snapshot.current_turn_status;
    }
}

SessionRegistry::SessionRegistry(size_t max_sessions)
    : max_sessions_(max_sessions) {}

bool SessionRegistry::add(const std::shared_ptr<CallSession>& session) {
    if (!session) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_sessions_ > 0 && sessions_.size() >= max_sessions_) {
        logging::warn(
            "Session limit reached",
            {kv("call_id", session->call_id()),
             kv("max_sessions", max_sessions_)});
        return false;
    }
    const auto inserted = sessions_.emplace(session->call_id(), session).second;
    if (!inserted) {
        logging::warn("Duplicate call id rejected", {kv("call_id", session->call_id())});
    }
    return inserted;
}

std::shared_ptr<CallSession> SessionRegistry::find(const std::string& call_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(call_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<CallSession> SessionRegistry::remove(const std::string& call_id) {
    std::shared_ptr<CallSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(call_id);
        if (it == sessions_.end()) {
            return nullptr;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }
    return session;
}

std::vector<SessionSnapshot> SessionRegistry::snapshots() const {
    std::vector<std::shared_ptr<CallSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.reserve(sessions_.size());
        for (const auto& entry : sessions_) {
            sessions.push_back(entry.second);
        }
    }
    std::vector<SessionSnapshot> result;
    result.reserve(sessions.size());
    for (const auto& session : sessions) {
        result.push_back(session->snapshot());
    }
    return result;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool SessionRegistry::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_sessions_ > 0 && sessions_.size() >= max_sessions_;
}

void SessionRegistry::close_all(const std::string& reason) {
    std::unordered_map<std::string, std::shared_ptr<CallSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& entry : sessions) {
        entry.second->teardown(reason);
    }
}

}

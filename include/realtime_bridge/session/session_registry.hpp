#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "realtime_bridge/session/call_session.hpp"

namespace realtime_bridge {

void to_json(nlohmann::json& j, const SessionSnapshot& snapshot);

// Live sessions by call id. Transports add a session when the call connects
// and remove it on their disconnect event; nothing else destroys a session.
class SessionRegistry {
public:
    explicit SessionRegistry(size_t max_sessions = 0);

    bool add(const std::shared_ptr<CallSession>& session);
    std::shared_ptr<CallSession> find(const std::string& call_id) const;
    std::shared_ptr<CallSession> remove(const std::string& call_id);
    std::vector<SessionSnapshot> snapshots() const;
    size_t size() const;
    bool full() const;
    // Tears every session down, used at shutdown.
    void close_all(const std::string& reason);

private:
    const size_t max_sessions_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CallSession>> sessions_;
};

}

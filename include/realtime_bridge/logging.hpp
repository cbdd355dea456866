#pragma once

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

#include "realtime_bridge/config.hpp"
#include "spdlog/logger.h"

namespace realtime_bridge {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << std::boolalpha << value;
    return {key, oss.str()};
}

// Durations render as milliseconds, e.g. "lag=42.5ms".
template <typename Rep, typename Period>
inline KeyValue kv(const std::string& key, const std::chrono::duration<Rep, Period>& value) {
    std::ostringstream oss;
    oss << std::chrono::duration<double, std::milli>(value).count() << "ms";
    return {key, oss.str()};
}

// Transcripts can run long; keep the head and note the full length.
KeyValue text_kv(const std::string& key, const std::string& text, size_t max_chars = 120);

std::string format_kv(std::initializer_list<KeyValue> items);
std::string with_kv(const std::string& message, std::initializer_list<KeyValue> items);

void init(const Config& config);
std::shared_ptr<spdlog::logger> get_logger();

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                std::initializer_list<KeyValue> items = {}) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, with_kv(message, items));
    }
}

inline void trace(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::trace, message, items);
}

inline void debug(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

// Limits a warning raised once per audio frame to one line per interval.
// ready() returns how many occurrences were folded into the line about to
// be written, or nullopt while the interval has not elapsed.
class Throttle {
public:
    using Clock = std::chrono::steady_clock;

    explicit Throttle(std::chrono::milliseconds interval);

    std::optional<uint64_t> ready(Clock::time_point now = Clock::now());

private:
    const std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::optional<Clock::time_point> last_;
    uint64_t suppressed_ = 0;
};

}

using logging::kv;
using logging::text_kv;
using logging::with_kv;
using logging::debug;
using logging::error;
using logging::info;
using logging::trace;
using logging::warn;

}

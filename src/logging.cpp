#include "realtime_bridge/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace realtime_bridge::logging {

namespace {

std::string& logger_name() {
    static std::string name = "realtime_bridge";
    return name;
}

spdlog::level::level_enum parse_level(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (value == "TRACE") return spdlog::level::trace;
    if (value == "DEBUG") return spdlog::level::debug;
    if (value == "WARN" || value == "WARNING") return spdlog::level::warn;
    if (value == "ERROR") return spdlog::level::err;
    if (value == "CRITICAL") return spdlog::level::critical;
    if (value == "OFF") return spdlog::level::off;
    return spdlog::level::info;
}

bool needs_quotes(const std::string& value) {
    return value.empty() ||
           value.find_first_of(" =\",\t\n") != std::string::npos;
}

void append_quoted(std::string& out, const std::string& value) {
    out += '"';
    for (const char ch : value) {
        if (ch == '"' || ch == '\\') {
            out += '\\';
            out += ch;
        } else if (ch == '\n') {
            out += "\\n";
        } else {
            out += ch;
        }
    }
    out += '"';
}

}

KeyValue text_kv(const std::string& key, const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) {
        return {key, text};
    }
    // Back off to a UTF-8 lead byte so a character is never split.
    size_t cut = max_chars;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return {key, text.substr(0, cut) + "...(" + std::to_string(text.size()) + " bytes)"};
}

std::string format_kv(std::initializer_list<KeyValue> items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += ", ";
        }
        result += item.key;
        result += '=';
        if (needs_quotes(item.value)) {
            append_quoted(result, item.value);
        } else {
            result += item.value;
        }
    }
    return result;
}

std::string with_kv(const std::string& message, std::initializer_list<KeyValue> items) {
    const auto context = format_kv(items);
    if (context.empty()) {
        return message;
    }
    return message + " [" + context + "]";
}

void init(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.log_filename) {
        const std::filesystem::path log_path(*config.log_filename);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(),
                                                                            true));
    }

    logger_name() = config.log_name;
    spdlog::drop(config.log_name);
    auto logger = std::make_shared<spdlog::logger>(config.log_name, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::set_level(parse_level(config.log_level));
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (auto logger = spdlog::get(logger_name())) {
        return logger;
    }
    return spdlog::default_logger();
}

Throttle::Throttle(std::chrono::milliseconds interval)
    : interval_(interval) {}

std::optional<uint64_t> Throttle::ready(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_ && now - *last_ < interval_) {
        ++suppressed_;
        return std::nullopt;
    }
    last_ = now;
    const auto folded = suppressed_;
    suppressed_ = 0;
    return folded;
}

}

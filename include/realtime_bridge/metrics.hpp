#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace realtime_bridge {

class Metrics {
public:
    static Metrics& instance();

    void increment_event(const std::string& event);
    void observe_latency(const std::string& stage, double seconds);
    void session_opened();
    void session_closed();
    uint64_t event_count(const std::string& event) const;
    int64_t active_sessions() const;
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& stage);

    mutable std::mutex mutex_;
    int64_t active_sessions_ = 0;
    std::unordered_map<std::string, uint64_t> events_;
    std::unordered_map<std::string, HistogramSeries> latency_histograms_;
    std::vector<double> histogram_bounds_;
};

}

#include "realtime_bridge/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace realtime_bridge {

namespace {

template <typename Map>
std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& item : map) {
        keys.push_back(item.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.005, 0.01, 0.02, 0.04, 0.06, 0.08, 0.1, 0.15,
                         0.2, 0.3, 0.5, 1.0, 2.5};
}

void Metrics::increment_event(const std::string& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++events_[event];
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& stage) {
    auto& series = latency_histograms_[stage];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_latency(const std::string& stage, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(stage);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

void Metrics::session_opened() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++active_sessions_;
}

void Metrics::session_closed() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_sessions_ > 0) {
        --active_sessions_;
    }
}

uint64_t Metrics::event_count(const std::string& event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = events_.find(event);
    return it == events_.end() ? 0 : it->second;
}

int64_t Metrics::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_sessions_;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP bridge_active_sessions Call sessions currently alive\n";
    out << "# TYPE bridge_active_sessions gauge\n";
    out << "bridge_active_sessions " << active_sessions_ << "\n";

    out << "# HELP bridge_events_total Call engine transitions by event\n";
    out << "# TYPE bridge_events_total counter\n";
    for (const auto& event : sorted_keys(events_)) {
        out << "bridge_events_total{event=\"" << event << "\"} "
            << events_.at(event) << "\n";
    }

    out << "# HELP bridge_latency_seconds Engine reaction latency\n";
    out << "# TYPE bridge_latency_seconds histogram\n";
    for (const auto& stage : sorted_keys(latency_histograms_)) {
        const auto& series = latency_histograms_.at(stage);
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "bridge_latency_seconds_bucket{stage=\"" << stage
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "bridge_latency_seconds_bucket{stage=\"" << stage
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "bridge_latency_seconds_count{stage=\"" << stage << "\"} "
            << series.count << "\n";
        out << "bridge_latency_seconds_sum{stage=\"" << stage << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}

#include "voicelive_bridge/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace voicelive_bridge {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.05, 0.1, 0.25, 0.5, 0.75, 1.0, 2.5, 5.0, 7.5, 10.0, 30.0};
}

void Metrics::increment_webhook_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++webhook_requests_total_;
}

void Metrics::increment_call_started() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_started_total_;
}

void Metrics::increment_call_terminated(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_terminated_[reason];
    ++calls_terminated_sum_;
}

void Metrics::increment_interruption() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++interruptions_total_;
}

void Metrics::add_dropped_frames(const std::string& direction, uint64_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped_frames_[direction] += count;
}

void Metrics::increment_tool_call(const std::string& tool, const std::string& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++tool_calls_[{tool, outcome}];
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& tool) {
    auto& series = tool_latency_[tool];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_tool_latency(const std::string& tool, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(tool);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

uint64_t Metrics::active_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_started_total_ - calls_terminated_sum_;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP webhook_requests_total Total number of webhook requests\n";
    out << "# TYPE webhook_requests_total counter\n";
    out << "webhook_requests_total " << webhook_requests_total_ << "\n";

    out << "# HELP calls_started_total Calls that entered the bridge\n";
    out << "# TYPE calls_started_total counter\n";
    out << "calls_started_total " << calls_started_total_ << "\n";

    out << "# HELP calls_active Calls currently bridged\n";
    out << "# TYPE calls_active gauge\n";
    out << "calls_active " << (calls_started_total_ - calls_terminated_sum_) << "\n";

    out << "# HELP calls_terminated_total Terminated calls by reason\n";
    out << "# TYPE calls_terminated_total counter\n";
    for (const auto& item : calls_terminated_) {
        out << "calls_terminated_total{reason=\"" << item.first << "\"} "
            << item.second << "\n";
    }

    out << "# HELP interruptions_total Barge-in interruptions of AI playback\n";
    out << "# TYPE interruptions_total counter\n";
    out << "interruptions_total " << interruptions_total_ << "\n";

    out << "# HELP audio_frames_dropped_total Audio frames dropped on buffer overflow\n";
    out << "# TYPE audio_frames_dropped_total counter\n";
    for (const auto& item : dropped_frames_) {
        out << "audio_frames_dropped_total{direction=\"" << item.first << "\"} "
            << item.second << "\n";
    }

    out << "# HELP tool_calls_total Tool calls by tool and outcome\n";
    out << "# TYPE tool_calls_total counter\n";
    for (const auto& item : tool_calls_) {
        out << "tool_calls_total{tool=\"" << item.first.first << "\",outcome=\""
            << item.first.second << "\"} " << item.second << "\n";
    }

    out << "# HELP tool_latency_seconds Tool execution latency\n";
    out << "# TYPE tool_latency_seconds histogram\n";
    for (const auto& item : tool_latency_) {
        const auto& tool = item.first;
        const auto& series = item.second;
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "tool_latency_seconds_bucket{tool=\"" << tool
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "tool_latency_seconds_bucket{tool=\"" << tool
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "tool_latency_seconds_count{tool=\"" << tool << "\"} "
            << series.count << "\n";
        out << "tool_latency_seconds_sum{tool=\"" << tool << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}

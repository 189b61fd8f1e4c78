#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voicelive_bridge {

class Metrics {
public:
    static Metrics& instance();

    void increment_webhook_request();
    void increment_call_started();
    void increment_call_terminated(const std::string& reason);
    void increment_interruption();
    void add_dropped_frames(const std::string& direction, uint64_t count);
    void increment_tool_call(const std::string& tool, const std::string& outcome);
    void observe_tool_latency(const std::string& tool, double seconds);
    uint64_t active_calls() const;
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& tool);

    mutable std::mutex mutex_;
    uint64_t webhook_requests_total_ = 0;
    uint64_t calls_started_total_ = 0;
    uint64_t calls_terminated_sum_ = 0;
    uint64_t interruptions_total_ = 0;
    std::map<std::string, uint64_t> calls_terminated_;
    std::map<std::string, uint64_t> dropped_frames_;
    std::map<std::pair<std::string, std::string>, uint64_t> tool_calls_;
    std::map<std::string, HistogramSeries> tool_latency_;
    std::vector<double> histogram_bounds_;
};

}

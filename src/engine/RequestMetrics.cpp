#include "engine/RequestMetrics.h"

namespace sentinel {
namespace engine {

void RequestMetricsRecorder::recordRequest(double response_time_ms, bool has_error) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.total_requests++;
    counters_.total_response_time_ms += response_time_ms;
    if (has_error) {
        counters_.error_count++;
    }
}

void RequestMetricsRecorder::recordError() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.error_count++;
}

RequestMetricsRecorder::Snapshot RequestMetricsRecorder::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

} // namespace engine
} // namespace sentinel

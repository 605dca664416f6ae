#pragma once

#include <cstdint>
#include <mutex>

namespace sentinel {
namespace engine {

// Cumulative request counters behind the error-rate / response-time figures
class RequestMetricsRecorder {
public:
    struct Snapshot {
        std::uint64_t total_requests = 0;
        std::uint64_t error_count = 0;
        double total_response_time_ms = 0.0;

        double errorRate() const {
            return total_requests > 0 ? static_cast<double>(error_count) / static_cast<double>(total_requests) : 0.0;
        }
        double avgResponseTimeMs() const {
            return total_requests > 0 ? total_response_time_ms / static_cast<double>(total_requests) : 0.0;
        }
    };

    void recordRequest(double response_time_ms, bool has_error = false);

    // Collaborator-reported failures count as errors without a request
    void recordError();

    Snapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    Snapshot counters_;
};

} // namespace engine
} // namespace sentinel

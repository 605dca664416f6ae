#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "backtest/SyntheticMarketGenerator.h"
#include "core/contracts/Collaborators.h"
#include "core/events/EventBus.h"
#include "engine/RequestMetrics.h"
#include "engine/SystemHealth.h"

namespace sentinel {
namespace engine {

// Owns the SystemHealth record. Each tick probes the five collaborators one by one,
// every probe isolated, then re-derives the overall status and resource metrics.
class HealthChecker {
public:
    static constexpr int PROBE_BAR_COUNT = 100;

    HealthChecker(
        core::Collaborators collaborators,
        core::EventBus& events,
        const RequestMetricsRecorder& request_metrics,
        std::uint64_t probe_seed = 0
    );

    // Never throws
    void checkHealth();

    // Collaborator-reported failure outside a tick
    void markComponent(const std::string& component, ComponentStatus status);

    SystemHealth snapshot() const;
    long long uptimeMs() const;

private:
    struct ProbeOutcome {
        ComponentStatus status = ComponentStatus::HEALTHY;
        long long duration_ms = 0;
        std::string error;
    };

    ProbeOutcome probe(const char* component, const std::function<void()>& call);
    void refreshMetrics(SystemHealth& health) const;

    core::Collaborators collaborators_;
    core::EventBus& events_;
    const RequestMetricsRecorder& request_metrics_;
    backtest::SyntheticMarketGenerator probe_data_;
    std::chrono::steady_clock::time_point start_time_;

    std::mutex tick_mutex_;             // one tick at a time
    mutable std::mutex health_mutex_;
    SystemHealth health_;
};

} // namespace engine
} // namespace sentinel

#include "engine/HealthChecker.h"
#include "common/Logger.h"
#include "common/ProcessStats.h"

#include <chrono>
#include <exception>
#include <map>
#include <stdexcept>

namespace sentinel {
namespace engine {

HealthChecker::HealthChecker(
    core::Collaborators collaborators,
    core::EventBus& events,
    const RequestMetricsRecorder& request_metrics,
    std::uint64_t probe_seed
)
    : collaborators_(std::move(collaborators))
    , events_(events)
    , request_metrics_(request_metrics)
    , probe_data_(probe_seed)
    , start_time_(std::chrono::steady_clock::now())
    , health_(makeInitialHealth())
{}

HealthChecker::ProbeOutcome HealthChecker::probe(const char* component, const std::function<void()>& call) {
    ProbeOutcome outcome;
    const auto started = std::chrono::steady_clock::now();
    try {
        call();
        outcome.status = ComponentStatus::HEALTHY;
    } catch (const std::exception& e) {
        outcome.status = ComponentStatus::CRITICAL;
        outcome.error = e.what();
        LOG_ERROR("Health probe failed [{}]: {}", component, e.what());
    } catch (...) {
        outcome.status = ComponentStatus::CRITICAL;
        outcome.error = "unknown error";
        LOG_ERROR("Health probe failed [{}]: unknown error", component);
    }
    outcome.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    ).count();
    return outcome;
}

void HealthChecker::checkHealth() {
    std::lock_guard<std::mutex> tick_lock(tick_mutex_);
    const auto started = std::chrono::steady_clock::now();

    auto require = [](const auto& ptr, const char* what) -> decltype(*ptr)& {
        if (!ptr) {
            throw std::runtime_error(std::string(what) + " not configured");
        }
        return *ptr;
    };

    std::map<std::string, ProbeOutcome> outcomes;

    outcomes[component::MARKET_STATE_ANALYZER] = probe(component::MARKET_STATE_ANALYZER, [&] {
        CandlesByTimeframe data;
        data[Timeframe::H1] = probe_data_.generate(PROBE_BAR_COUNT);
        require(collaborators_.market_state_analyzer, "market state analyzer")
            .analyzeState(data, 100.0, 1000000.0);
    });

    outcomes[component::PARAMETER_MANAGER] = probe(component::PARAMETER_MANAGER, [&] {
        require(collaborators_.parameter_manager, "parameter manager").getCurrentParameters();
    });

    outcomes[component::CALIBRATION_SERVICE] = probe(component::CALIBRATION_SERVICE, [&] {
        require(collaborators_.calibration_service, "calibration service").getStatus();
    });

    outcomes[component::HOT_UPDATE_SERVICE] = probe(component::HOT_UPDATE_SERVICE, [&] {
        require(collaborators_.hot_update_service, "hot update service").getServiceStatus();
    });

    outcomes[component::ADAPTIVE_STRATEGY] = probe(component::ADAPTIVE_STRATEGY, [&] {
        require(collaborators_.strategy_service, "strategy service").getServiceStatus();
    });

    ComponentStatus overall;
    {
        std::lock_guard<std::mutex> lock(health_mutex_);
        for (const auto& entry : outcomes) {
            health_.components[entry.first] = entry.second.status;
            health_.probe_duration_ms[entry.first] = entry.second.duration_ms;
        }
        health_.overall = aggregateStatus(health_.components);
        refreshMetrics(health_);
        health_.last_check = nowMs();
        overall = health_.overall;
    }

    for (const auto& entry : outcomes) {
        if (entry.second.status == ComponentStatus::CRITICAL) {
            core::ErrorEvent event;
            event.component = entry.first;
            event.error = entry.second.error;
            event.context = "health_check";
            events_.publishError(event);
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    ).count();
    LOG_INFO("Health check done in {}ms: overall={}", elapsed, toString(overall));
}

void HealthChecker::markComponent(const std::string& name, ComponentStatus status) {
    std::lock_guard<std::mutex> lock(health_mutex_);
    health_.components[name] = status;
    health_.overall = aggregateStatus(health_.components);
}

SystemHealth HealthChecker::snapshot() const {
    std::lock_guard<std::mutex> lock(health_mutex_);
    return health_;
}

long long HealthChecker::uptimeMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_
    ).count();
}

void HealthChecker::refreshMetrics(SystemHealth& health) const {
    const auto counters = request_metrics_.snapshot();
    health.metrics.uptime_ms = uptimeMs();
    health.metrics.memory_usage = utils::ProcessStats::memoryUsageRatio();
    health.metrics.error_rate = counters.errorRate();
    health.metrics.avg_response_time_ms = counters.avgResponseTimeMs();
}

} // namespace engine
} // namespace sentinel

#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace sentinel {
namespace engine {

enum class ComponentStatus { HEALTHY, WARNING, CRITICAL };

const char* toString(ComponentStatus status);

// Component keys used in SystemHealth::components
namespace component {
constexpr const char* MARKET_STATE_ANALYZER = "marketStateAnalyzer";
constexpr const char* PARAMETER_MANAGER = "parameterManager";
constexpr const char* CALIBRATION_SERVICE = "calibrationService";
constexpr const char* HOT_UPDATE_SERVICE = "hotUpdateService";
constexpr const char* ADAPTIVE_STRATEGY = "adaptiveStrategy";
}

struct HealthMetrics {
    long long uptime_ms = 0;
    double memory_usage = 0.0;          // resident / physical
    double error_rate = 0.0;
    double avg_response_time_ms = 0.0;
};

struct SystemHealth {
    ComponentStatus overall = ComponentStatus::HEALTHY;
    std::map<std::string, ComponentStatus> components;
    std::map<std::string, long long> probe_duration_ms;
    HealthMetrics metrics;
    long long last_check = 0;
};

// CRITICAL if any component is CRITICAL, else WARNING if any is WARNING, else HEALTHY
ComponentStatus aggregateStatus(const std::map<std::string, ComponentStatus>& components);

// All five components HEALTHY, stamped now
SystemHealth makeInitialHealth();

nlohmann::json toJson(const SystemHealth& health);

} // namespace engine
} // namespace sentinel

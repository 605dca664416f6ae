#include "engine/SystemHealth.h"
#include "common/Types.h"

namespace sentinel {
namespace engine {

const char* toString(ComponentStatus status) {
    switch (status) {
        case ComponentStatus::HEALTHY: return "HEALTHY";
        case ComponentStatus::WARNING: return "WARNING";
        case ComponentStatus::CRITICAL: return "CRITICAL";
    }
    return "CRITICAL";
}

ComponentStatus aggregateStatus(const std::map<std::string, ComponentStatus>& components) {
    bool any_warning = false;
    for (const auto& entry : components) {
        if (entry.second == ComponentStatus::CRITICAL) {
            return ComponentStatus::CRITICAL;
        }
        if (entry.second == ComponentStatus::WARNING) {
            any_warning = true;
        }
    }
    return any_warning ? ComponentStatus::WARNING : ComponentStatus::HEALTHY;
}

SystemHealth makeInitialHealth() {
    SystemHealth health;
    for (const char* name : {component::MARKET_STATE_ANALYZER,
                             component::PARAMETER_MANAGER,
                             component::CALIBRATION_SERVICE,
                             component::HOT_UPDATE_SERVICE,
                             component::ADAPTIVE_STRATEGY}) {
        health.components[name] = ComponentStatus::HEALTHY;
    }
    health.overall = aggregateStatus(health.components);
    health.last_check = nowMs();
    return health;
}

nlohmann::json toJson(const SystemHealth& health) {
    nlohmann::json j;
    j["overall"] = toString(health.overall);
    j["components"] = nlohmann::json::object();
    for (const auto& entry : health.components) {
        j["components"][entry.first] = toString(entry.second);
    }
    j["probe_duration_ms"] = health.probe_duration_ms;
    j["metrics"] = {
        {"uptime_ms", health.metrics.uptime_ms},
        {"memory_usage", health.metrics.memory_usage},
        {"error_rate", health.metrics.error_rate},
        {"avg_response_time_ms", health.metrics.avg_response_time_ms}
    };
    j["last_check"] = health.last_check;
    return j;
}

} // namespace engine
} // namespace sentinel

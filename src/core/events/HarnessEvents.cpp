#include "core/events/HarnessEvents.h"

namespace sentinel {
namespace core {

const char* toString(HarnessEventType type) {
    switch (type) {
        case HarnessEventType::SYSTEM_INITIALIZED: return "system_initialized";
        case HarnessEventType::PERFORMANCE_EVALUATED: return "performance_evaluated";
        case HarnessEventType::BENCHMARK_COMPLETED: return "benchmark_completed";
        case HarnessEventType::ERROR_EVENT: return "error";
        case HarnessEventType::WARNING: return "warning";
    }
    return "error";
}

nlohmann::json toJson(const PerformanceMetrics& metrics) {
    nlohmann::json j;
    j["sharpe_ratio"] = metrics.sharpe_ratio;
    j["max_drawdown"] = metrics.max_drawdown;
    j["win_rate"] = metrics.win_rate;
    j["avg_return"] = metrics.avg_return;
    j["volatility"] = metrics.volatility;
    j["calmar_ratio"] = metrics.calmar_ratio;
    j["sortino_ratio"] = metrics.sortino_ratio;
    j["total_trades"] = metrics.total_trades;
    j["profit_factor"] = metrics.profit_factor;
    if (metrics.calibration_error) {
        j["calibration_error"] = *metrics.calibration_error;
    }
    return j;
}

nlohmann::json toJson(const ErrorEvent& event) {
    nlohmann::json j;
    if (event.component) {
        j["component"] = *event.component;
    }
    j["error"] = event.error;
    if (event.context) {
        j["context"] = *event.context;
    }
    return j;
}

nlohmann::json toJson(const WarningEvent& event) {
    nlohmann::json j;
    j["type"] = event.type;
    j["warnings"] = event.warnings;
    j["metrics"] = toJson(event.metrics);
    return j;
}

} // namespace core
} // namespace sentinel

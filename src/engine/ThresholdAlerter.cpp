#include "engine/ThresholdAlerter.h"
#include "common/Logger.h"

#include <spdlog/fmt/fmt.h>

namespace sentinel {
namespace engine {

ThresholdAlerter::ThresholdAlerter(PerformanceThresholds thresholds, core::EventBus& events)
    : thresholds_(thresholds)
    , events_(events)
{}

std::vector<std::string> ThresholdAlerter::collectWarnings(
    const PerformanceMetrics& metrics,
    const PerformanceThresholds& thresholds
) {
    std::vector<std::string> warnings;

    if (metrics.sharpe_ratio < thresholds.min_sharpe_ratio) {
        warnings.push_back(fmt::format("Sharpe ratio too low: {:.2f} < {:.2f}",
                                       metrics.sharpe_ratio, thresholds.min_sharpe_ratio));
    }

    if (metrics.max_drawdown > thresholds.max_drawdown) {
        warnings.push_back(fmt::format("Max drawdown too high: {:.1f}% > {:.1f}%",
                                       metrics.max_drawdown * 100.0, thresholds.max_drawdown * 100.0));
    }

    if (metrics.win_rate < thresholds.min_win_rate) {
        warnings.push_back(fmt::format("Win rate too low: {:.1f}% < {:.1f}%",
                                       metrics.win_rate * 100.0, thresholds.min_win_rate * 100.0));
    }

    if (metrics.calibration_error && *metrics.calibration_error > thresholds.max_calibration_error) {
        warnings.push_back(fmt::format("Calibration error too high: {:.3f} > {:.3f}",
                                       *metrics.calibration_error, thresholds.max_calibration_error));
    }

    return warnings;
}

std::vector<std::string> ThresholdAlerter::evaluate(const PerformanceMetrics& metrics) {
    auto warnings = collectWarnings(metrics, thresholds_);
    if (warnings.empty()) {
        return warnings;
    }

    for (const auto& w : warnings) {
        LOG_WARN("Performance threshold: {}", w);
    }

    core::WarningEvent event;
    event.type = WARNING_TYPE;
    event.warnings = warnings;
    event.metrics = metrics;
    events_.publishWarning(event);
    return warnings;
}

} // namespace engine
} // namespace sentinel

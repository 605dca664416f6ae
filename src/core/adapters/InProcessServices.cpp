#include "core/adapters/InProcessServices.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace sentinel {
namespace core {

StaticParameterManager::StaticParameterManager(std::map<std::string, double> values, std::string market_state) {
    parameters_.values = std::move(values);
    parameters_.market_state = std::move(market_state);
    parameters_.confidence = 0.5;
    parameters_.updated_at = nowMs();
}

AdaptiveParameters StaticParameterManager::getCurrentParameters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return parameters_;
}

ParameterStats StaticParameterManager::getParameterStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ParameterStats stats;
    stats.total_adjustments = adjustments_;
    stats.most_frequent_market_state = parameters_.market_state;
    if (adjustments_ > 0) {
        stats.avg_confidence = confidence_sum_ / adjustments_;
        // 1.0 when updates barely move the values, approaching 0 as they swing
        stats.parameter_stability = 1.0 / (1.0 + relative_change_sum_ / adjustments_);
    }
    return stats;
}

void StaticParameterManager::update(const std::string& key, double value, double confidence) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = parameters_.values[key];
    const double base = std::max(std::abs(slot), 1e-9);
    relative_change_sum_ += std::abs(value - slot) / base;
    slot = value;

    adjustments_++;
    confidence_sum_ += confidence;
    parameters_.confidence = confidence;
    parameters_.updated_at = nowMs();
}

FixedCalibrationService::FixedCalibrationService(CalibrationPerformanceMap performance)
    : performance_(std::move(performance))
    , created_at_(nowMs())
{}

CalibrationStatus FixedCalibrationService::getStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CalibrationStatus status;
    status.total_strategies = static_cast<int>(performance_.size());
    status.active_strategies = active_ ? status.total_strategies : 0;
    status.trained_models = status.total_strategies;
    status.last_update = created_at_;
    return status;
}

CalibrationPerformanceMap FixedCalibrationService::getCalibrationPerformance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return performance_;
}

void FixedCalibrationService::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = false;
}

ServiceStatus PassiveHotUpdateService::getServiceStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void PassiveHotUpdateService::setErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void PassiveHotUpdateService::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.active = false;
    status_.detail = "stopped";
}

void PassiveHotUpdateService::recordUpdate(const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.total_updates++;
    status_.last_update = nowMs();
    status_.detail = detail;
}

void PassiveHotUpdateService::reportError(const std::string& error) {
    ErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_.detail = "error: " + error;
        handler = handler_;
    }
    if (handler) {
        handler(error);
    } else {
        LOG_WARN("Hot update error with no handler: {}", error);
    }
}

} // namespace core
} // namespace sentinel

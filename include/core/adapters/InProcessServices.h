#pragma once

#include <map>
#include <mutex>
#include <string>

#include "core/contracts/ICalibrationService.h"
#include "core/contracts/IHotUpdateService.h"
#include "core/contracts/IParameterManager.h"

namespace sentinel {
namespace core {

// Parameter set fixed at construction; every update() is counted as an adjustment
class StaticParameterManager : public IParameterManager {
public:
    explicit StaticParameterManager(std::map<std::string, double> values, std::string market_state = "SIDEWAYS");

    AdaptiveParameters getCurrentParameters() const override;
    ParameterStats getParameterStats() const override;

    void update(const std::string& key, double value, double confidence);

private:
    mutable std::mutex mutex_;
    AdaptiveParameters parameters_;
    int adjustments_ = 0;
    double confidence_sum_ = 0.0;
    double relative_change_sum_ = 0.0;
};

// Reports a fixed calibration table per model id
class FixedCalibrationService : public ICalibrationService {
public:
    explicit FixedCalibrationService(CalibrationPerformanceMap performance);

    CalibrationStatus getStatus() const override;
    CalibrationPerformanceMap getCalibrationPerformance() const override;
    void stop() override;

private:
    mutable std::mutex mutex_;
    CalibrationPerformanceMap performance_;
    long long created_at_;
    bool active_ = true;
};

// No background work of its own; reportError() lets the host surface a failed update
class PassiveHotUpdateService : public IHotUpdateService {
public:
    ServiceStatus getServiceStatus() const override;
    void setErrorHandler(ErrorHandler handler) override;
    void stop() override;

    void recordUpdate(const std::string& detail);
    void reportError(const std::string& error);

private:
    mutable std::mutex mutex_;
    ErrorHandler handler_;
    ServiceStatus status_{true, 0, 0, "idle"};
};

} // namespace core
} // namespace sentinel

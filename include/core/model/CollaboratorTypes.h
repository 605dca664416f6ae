#pragma once

#include <map>
#include <string>

#include "common/Types.h"

namespace sentinel {
namespace core {

struct MarketStateResult {
    std::string state = "SIDEWAYS";     // TRENDING_UP, TRENDING_DOWN, SIDEWAYS, HIGH_VOLATILITY, ...
    double confidence = 0.0;
    double trend_score = 0.0;           // -1.0 (down) ~ 1.0 (up)
    long long timestamp = 0;
};

struct AdaptiveParameters {
    std::map<std::string, double> values;
    std::string market_state;
    double confidence = 0.0;
    long long updated_at = 0;
};

struct ParameterStats {
    int total_adjustments = 0;
    double avg_confidence = 0.5;
    std::string most_frequent_market_state = "SIDEWAYS";
    double parameter_stability = 1.0;   // 0.0 ~ 1.0
};

struct ParameterAdjustment {
    std::string market_state;
    std::string reason;
    double confidence = 0.0;
    double expected_improvement = 0.0;
    long long timestamp = 0;
};

struct CalibrationPerformance {
    double brier_score = 0.0;
    double calibration_error = 0.0;
};

// model id -> performance
using CalibrationPerformanceMap = std::map<std::string, CalibrationPerformance>;

struct CalibrationStatus {
    int total_strategies = 0;
    int active_strategies = 0;
    int trained_models = 0;
    long long last_update = 0;
};

// Generic status reply of the hot-update and strategy services
struct ServiceStatus {
    bool active = false;
    int total_updates = 0;
    long long last_update = 0;
    std::string detail;
};

} // namespace core
} // namespace sentinel

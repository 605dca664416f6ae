#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace sentinel {
namespace backtest {

// Market-state accuracy is not measured by the harness; reported as a fixed value
constexpr double MARKET_STATE_ACCURACY_PLACEHOLDER = 0.75;

struct BenchmarkResult {
    std::string test_name;
    long long duration_ms = 0;
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double calmar_ratio = 0.0;
    double max_drawdown = 0.0;
    double win_rate = 0.0;
    int total_trades = 0;
    double avg_return = 0.0;
    double volatility = 0.0;
    double profit_factor = 0.0;
    double brier_score = 0.0;
    double calibration_error = 0.0;
    double market_state_accuracy = MARKET_STATE_ACCURACY_PLACEHOLDER;
    double parameter_stability = 0.0;
    long long timestamp = 0;
};

nlohmann::json toJson(const BenchmarkResult& result);

} // namespace backtest
} // namespace sentinel

#include "backtest/BenchmarkResult.h"

namespace sentinel {
namespace backtest {

nlohmann::json toJson(const BenchmarkResult& result) {
    nlohmann::json j;
    j["test_name"] = result.test_name;
    j["duration_ms"] = result.duration_ms;
    j["sharpe_ratio"] = result.sharpe_ratio;
    j["sortino_ratio"] = result.sortino_ratio;
    j["calmar_ratio"] = result.calmar_ratio;
    j["max_drawdown"] = result.max_drawdown;
    j["win_rate"] = result.win_rate;
    j["total_trades"] = result.total_trades;
    j["avg_return"] = result.avg_return;
    j["volatility"] = result.volatility;
    j["profit_factor"] = result.profit_factor;
    j["brier_score"] = result.brier_score;
    j["calibration_error"] = result.calibration_error;
    j["market_state_accuracy"] = result.market_state_accuracy;
    j["parameter_stability"] = result.parameter_stability;
    j["timestamp"] = result.timestamp;
    return j;
}

} // namespace backtest
} // namespace sentinel

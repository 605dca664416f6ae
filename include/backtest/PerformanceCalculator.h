#pragma once

#include <vector>

namespace sentinel {
namespace backtest {

// Risk-adjusted ratios over a per-trade return series (0.02 == +2%).
// Degenerate inputs resolve to fixed fallbacks, never NaN/inf.
class PerformanceCalculator {
public:
    // Cap reported for Sortino / profit factor when there is no downside
    static constexpr double NO_DOWNSIDE_RATIO = 10.0;

    static double mean(const std::vector<double>& returns);

    // Sample standard deviation (n-1); 0 with fewer than 2 samples
    static double volatility(const std::vector<double>& returns);

    // avg / vol; 0 when vol == 0
    static double sharpe(double avg_return, double volatility);

    // avg / sqrt(mean(r^2 | r < 0)); without losses: 10 if avg > 0 else 0
    static double sortino(const std::vector<double>& returns);

    // total / maxDD; 0 when maxDD == 0
    static double calmar(double total_return, double max_drawdown);

    // gross profit / |gross loss|; without losses: 10 if profit > 0 else 1
    static double profitFactor(const std::vector<double>& returns);
};

} // namespace backtest
} // namespace sentinel

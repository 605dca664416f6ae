#include "backtest/PerformanceCalculator.h"

#include <cmath>
#include <numeric>

namespace sentinel {
namespace backtest {

double PerformanceCalculator::mean(const std::vector<double>& returns) {
    if (returns.empty()) {
        return 0.0;
    }
    return std::accumulate(returns.begin(), returns.end(), 0.0) / static_cast<double>(returns.size());
}

double PerformanceCalculator::volatility(const std::vector<double>& returns) {
    if (returns.size() < 2) {
        return 0.0;
    }

    const double avg = mean(returns);
    double sum_sq = 0.0;
    for (double r : returns) {
        sum_sq += (r - avg) * (r - avg);
    }
    return std::sqrt(sum_sq / static_cast<double>(returns.size() - 1));
}

double PerformanceCalculator::sharpe(double avg_return, double volatility) {
    if (volatility == 0.0) {
        return 0.0;
    }
    return avg_return / volatility;
}

double PerformanceCalculator::sortino(const std::vector<double>& returns) {
    if (returns.empty()) {
        return 0.0;
    }

    const double avg = mean(returns);
    double downside_sq = 0.0;
    int downside_count = 0;
    for (double r : returns) {
        if (r < 0.0) {
            downside_sq += r * r;
            downside_count++;
        }
    }

    if (downside_count == 0) {
        return avg > 0.0 ? NO_DOWNSIDE_RATIO : 0.0;
    }

    const double downside_dev = std::sqrt(downside_sq / static_cast<double>(downside_count));
    return downside_dev > 0.0 ? avg / downside_dev : 0.0;
}

double PerformanceCalculator::calmar(double total_return, double max_drawdown) {
    if (max_drawdown == 0.0) {
        return 0.0;
    }
    return total_return / max_drawdown;
}

double PerformanceCalculator::profitFactor(const std::vector<double>& returns) {
    double gross_profit = 0.0;
    double gross_loss = 0.0;
    for (double r : returns) {
        if (r > 0.0) {
            gross_profit += r;
        } else if (r < 0.0) {
            gross_loss += r;
        }
    }
    gross_loss = std::abs(gross_loss);

    if (gross_loss > 0.0) {
        return gross_profit / gross_loss;
    }
    return gross_profit > 0.0 ? NO_DOWNSIDE_RATIO : 1.0;
}

} // namespace backtest
} // namespace sentinel

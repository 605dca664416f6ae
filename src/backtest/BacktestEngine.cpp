#include "backtest/BacktestEngine.h"
#include "backtest/PerformanceCalculator.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace sentinel {
namespace backtest {

BacktestEngine::BacktestEngine(
    std::shared_ptr<core::ICalibrationService> calibration_service,
    std::shared_ptr<core::IParameterManager> parameter_manager,
    double fee_rate
)
    : calibration_service_(std::move(calibration_service))
    , parameter_manager_(std::move(parameter_manager))
    , fee_rate_(fee_rate)
{
    if (!calibration_service_ || !parameter_manager_) {
        throw std::invalid_argument("BacktestEngine requires calibration and parameter collaborators");
    }
}

BenchmarkResult BacktestEngine::run(
    const std::vector<Candle>& bars,
    core::IStrategyService& strategy,
    double notional
) {
    const auto started = std::chrono::steady_clock::now();

    std::vector<Trade> trades;
    double total_return = 0.0;
    double max_drawdown = 0.0;
    double current_drawdown = 0.0;
    int win_count = 0;
    int failed_signals = 0;
    int invalid_bars = 0;

    std::vector<Candle> window;
    window.reserve(LOOKBACK_BARS);

    for (size_t i = 0; i < bars.size(); ++i) {
        const size_t begin = (i + 1 > LOOKBACK_BARS) ? i + 1 - LOOKBACK_BARS : 0;
        if (i + 1 - begin < MIN_WINDOW_BARS) {
            continue;
        }
        // No trade can enter on a bar without a usable price
        if (!(bars[i].close > 0.0) || !std::isfinite(bars[i].close)) {
            invalid_bars++;
            continue;
        }
        window.assign(bars.begin() + begin, bars.begin() + i + 1);

        StrategySignal signal;
        try {
            signal = strategy.generateSignal(window, bars[i].close, notional);
        } catch (const std::exception& e) {
            failed_signals++;
            LOG_WARN("Signal generation failed at bar {}: {}", i, e.what());
            continue;
        } catch (...) {
            failed_signals++;
            LOG_WARN("Signal generation failed at bar {}: unknown error", i);
            continue;
        }

        if (signal.action == SignalAction::HOLD) {
            continue;
        }

        const double trade_return = simulateTradeReturn(signal, bars, i);
        trades.push_back(Trade{i, trade_return, signal});

        total_return += trade_return;
        if (trade_return > 0.0) {
            win_count++;
        }

        if (trade_return < 0.0) {
            current_drawdown += std::abs(trade_return);
            max_drawdown = std::max(max_drawdown, current_drawdown);
        } else {
            current_drawdown = std::max(0.0, current_drawdown - trade_return);
        }
    }

    std::vector<double> returns;
    returns.reserve(trades.size());
    for (const auto& trade : trades) {
        returns.push_back(trade.simulated_return);
    }

    BenchmarkResult result;
    result.total_trades = static_cast<int>(trades.size());
    result.max_drawdown = max_drawdown;
    result.win_rate = trades.empty() ? 0.0 : static_cast<double>(win_count) / static_cast<double>(trades.size());
    result.avg_return = trades.empty() ? 0.0 : total_return / static_cast<double>(trades.size());
    result.volatility = PerformanceCalculator::volatility(returns);
    result.sharpe_ratio = PerformanceCalculator::sharpe(result.avg_return, result.volatility);
    result.sortino_ratio = PerformanceCalculator::sortino(returns);
    result.calmar_ratio = PerformanceCalculator::calmar(total_return, max_drawdown);
    result.profit_factor = PerformanceCalculator::profitFactor(returns);

    fillCalibrationMetrics(result);
    result.market_state_accuracy = MARKET_STATE_ACCURACY_PLACEHOLDER;
    result.parameter_stability = parameter_manager_->getParameterStats().parameter_stability;

    result.timestamp = nowMs();
    result.test_name = "benchmark_" + std::to_string(result.timestamp);
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    ).count();

    if (invalid_bars > 0) {
        LOG_WARN("Backtest skipped {} bars with a non-positive close", invalid_bars);
    }
    if (failed_signals > 0) {
        LOG_WARN("Backtest skipped {} bars due to signal failures", failed_signals);
    }
    LOG_DEBUG("Backtest replayed {} bars: trades={}, total_return={:.4f}, max_dd={:.4f}",
              bars.size(), result.total_trades, total_return, max_drawdown);

    return result;
}

double BacktestEngine::simulateTradeReturn(
    const StrategySignal& signal,
    const std::vector<Candle>& bars,
    size_t index
) const {
    const double entry_price = bars[index].close;
    const long long holding_hours = signal.holding_duration_ms / ONE_HOUR_MS;
    const size_t holding_bars = static_cast<size_t>(
        std::max(0LL, std::min(static_cast<long long>(MAX_HOLDING_BARS), holding_hours))
    );
    const size_t exit_index = std::min(bars.size() - 1, index + holding_bars);
    const double exit_price = bars[exit_index].close;

    const double price_change = (exit_price - entry_price) / entry_price;
    const double direction = (signal.action == SignalAction::BUY) ? 1.0 : -1.0;

    return price_change * direction * signal.leverage - fee_rate_ * 2.0;
}

void BacktestEngine::fillCalibrationMetrics(BenchmarkResult& result) const {
    const auto performance = calibration_service_->getCalibrationPerformance();
    if (performance.empty()) {
        result.brier_score = 0.0;
        result.calibration_error = 0.0;
        return;
    }

    double brier_sum = 0.0;
    double error_sum = 0.0;
    for (const auto& entry : performance) {
        brier_sum += entry.second.brier_score;
        error_sum += entry.second.calibration_error;
    }
    const double n = static_cast<double>(performance.size());
    result.brier_score = brier_sum / n;
    result.calibration_error = error_sum / n;
}

} // namespace backtest
} // namespace sentinel

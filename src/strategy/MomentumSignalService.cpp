#include "strategy/MomentumSignalService.h"
#include "analytics/TechnicalIndicators.h"
#include "backtest/PerformanceCalculator.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>

namespace sentinel {
namespace strategy {

namespace {
constexpr double MAX_MIN_SPREAD = 0.01;

PerformanceMetrics computeRollingMetrics(const std::deque<double>& closed) {
    using backtest::PerformanceCalculator;

    std::vector<double> returns(closed.begin(), closed.end());
    PerformanceMetrics metrics;
    metrics.total_trades = static_cast<int>(returns.size());
    if (returns.empty()) {
        return metrics;
    }

    double total = 0.0;
    double drawdown = 0.0;
    double max_drawdown = 0.0;
    int wins = 0;
    for (double r : returns) {
        total += r;
        if (r > 0.0) wins++;
        if (r < 0.0) {
            drawdown += std::abs(r);
            max_drawdown = std::max(max_drawdown, drawdown);
        } else {
            drawdown = std::max(0.0, drawdown - r);
        }
    }

    metrics.win_rate = static_cast<double>(wins) / static_cast<double>(returns.size());
    metrics.avg_return = PerformanceCalculator::mean(returns);
    metrics.volatility = PerformanceCalculator::volatility(returns);
    metrics.sharpe_ratio = PerformanceCalculator::sharpe(metrics.avg_return, metrics.volatility);
    metrics.sortino_ratio = PerformanceCalculator::sortino(returns);
    metrics.max_drawdown = max_drawdown;
    metrics.calmar_ratio = PerformanceCalculator::calmar(total, max_drawdown);
    metrics.profit_factor = PerformanceCalculator::profitFactor(returns);
    return metrics;
}
}

MomentumSignalService::MomentumSignalService(MomentumConfig config)
    : config_(config)
{
    if (config_.fast_period <= 0 || config_.slow_period <= config_.fast_period) {
        throw std::invalid_argument("momentum periods must satisfy 0 < fast < slow");
    }
}

std::vector<double> MomentumSignalService::settlePending(const Candle& bar) {
    std::vector<double> settled;
    while (!pending_.empty() && pending_.front().exit_after <= bar.timestamp) {
        const auto& p = pending_.front();
        const double change = (bar.close - p.entry_price) / p.entry_price;
        settled.push_back(p.action == SignalAction::BUY ? change : -change);
        pending_.pop_front();
    }
    return settled;
}

StrategySignal MomentumSignalService::generateSignal(
    const std::vector<Candle>& window,
    double current_price,
    double notional
) {
    StrategySignal signal;
    signal.strategy_id = STRATEGY_ID;
    signal.timestamp = nowMs();

    std::optional<std::string> error;
    std::optional<PerformanceMetrics> report;
    std::optional<core::ParameterAdjustment> adjustment;
    core::StrategyServiceListener listener;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;

        if (!active_) {
            return signal;
        }

        if (window.empty()) {
            throw std::invalid_argument("empty candle window");
        }
        if (current_price <= 0.0 || window.back().close <= 0.0) {
            error = "invalid price in candle window";
        } else {
            const Candle& bar = window.back();

            // A replay restarted from older data
            if (bar.timestamp < last_bar_ts_) {
                pending_.clear();
            }
            last_bar_ts_ = bar.timestamp;

            for (double r : settlePending(bar)) {
                closed_returns_.push_back(r);
                if (closed_returns_.size() > config_.rolling_window) {
                    closed_returns_.pop_front();
                }
                trades_since_report_++;
            }

            if (trades_since_report_ >= config_.report_every_trades) {
                trades_since_report_ = 0;
                report = computeRollingMetrics(closed_returns_);

                const double base_spread = MomentumConfig{}.min_spread;
                if (report->win_rate < 0.4 && config_.min_spread < MAX_MIN_SPREAD) {
                    config_.min_spread = std::min(MAX_MIN_SPREAD, config_.min_spread * 1.5);
                    adjustment = core::ParameterAdjustment{
                        "LOSING", "win rate below 40%, widening entry spread", 1.0 - report->win_rate, 0.0, nowMs()};
                } else if (report->win_rate > 0.6 && config_.min_spread > base_spread) {
                    config_.min_spread = std::max(base_spread, config_.min_spread / 1.5);
                    adjustment = core::ParameterAdjustment{
                        "WINNING", "win rate above 60%, narrowing entry spread", report->win_rate, 0.0, nowMs()};
                }
            }

            if (window.size() > static_cast<size_t>(config_.slow_period)) {
                const auto prices = analytics::TechnicalIndicators::extractClosePrices(window);
                const double ema_fast = analytics::TechnicalIndicators::calculateEMA(prices, config_.fast_period);
                const double ema_slow = analytics::TechnicalIndicators::calculateEMA(prices, config_.slow_period);
                const double rsi = analytics::TechnicalIndicators::calculateRSI(prices, 14);
                const double atr = analytics::TechnicalIndicators::calculateATR(window, 14);
                const double spread = ema_slow > 0.0 ? ema_fast / ema_slow - 1.0 : 0.0;

                if (spread > config_.min_spread && rsi < config_.rsi_overbought) {
                    signal.action = SignalAction::BUY;
                    signal.stop_loss = current_price - atr * config_.stop_loss_atr_mult;
                    signal.take_profit = current_price + atr * config_.take_profit_atr_mult;
                    signal.market_state = "TRENDING_UP";
                } else if (spread < -config_.min_spread && rsi > config_.rsi_oversold) {
                    signal.action = SignalAction::SELL;
                    signal.stop_loss = current_price + atr * config_.stop_loss_atr_mult;
                    signal.take_profit = current_price - atr * config_.take_profit_atr_mult;
                    signal.market_state = "TRENDING_DOWN";
                }

                if (signal.action != SignalAction::HOLD) {
                    LOG_DEBUG("[Momentum] {} spread={:.4f} rsi={:.1f}", toString(signal.action), spread, rsi);
                    signal.strength = std::min(1.0, std::abs(spread) / (config_.min_spread * 5.0));
                    signal.confidence = std::min(1.0, 0.5 + signal.strength * 0.5);
                    signal.holding_duration_ms = config_.holding_duration_ms;
                    pending_.push_back(PendingSignal{
                        signal.action, current_price, bar.timestamp + config_.holding_duration_ms});
                    total_signals_++;
                    last_update_ = signal.timestamp;
                }
            }
        }
    }

    if (error) {
        LOG_WARN("[Momentum] {} (notional {:.0f})", *error, notional);
        if (listener.on_error) listener.on_error(*error);
        throw std::invalid_argument(*error);
    }
    if (report && listener.on_performance_updated) {
        listener.on_performance_updated(*report);
    }
    if (adjustment && listener.on_parameters_adjusted) {
        listener.on_parameters_adjusted(*adjustment);
    }

    return signal;
}

core::ServiceStatus MomentumSignalService::getServiceStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    core::ServiceStatus status;
    status.active = active_;
    status.total_updates = total_signals_;
    status.last_update = last_update_;
    status.detail = std::string(STRATEGY_ID) + " open=" + std::to_string(pending_.size())
                  + " closed=" + std::to_string(closed_returns_.size());
    return status;
}

void MomentumSignalService::setListener(core::StrategyServiceListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void MomentumSignalService::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = false;
    pending_.clear();
}

double MomentumSignalService::currentMinSpread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_spread;
}

} // namespace strategy
} // namespace sentinel

#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "core/contracts/IStrategyService.h"

namespace sentinel {
namespace strategy {

struct MomentumConfig {
    int fast_period = 12;
    int slow_period = 26;
    double min_spread = 0.001;          // |EMA fast / EMA slow - 1| needed to act
    double rsi_overbought = 70.0;
    double rsi_oversold = 30.0;
    long long holding_duration_ms = 6LL * 60LL * 60LL * 1000LL;
    double stop_loss_atr_mult = 2.0;
    double take_profit_atr_mult = 3.0;
    int report_every_trades = 20;       // closed trades between performance reports
    size_t rolling_window = 200;
};

// EMA-crossover signal service. Tracks the outcome of the signals it emits against
// later windows and reports rolling performance through the listener.
class MomentumSignalService : public core::IStrategyService {
public:
    static constexpr const char* STRATEGY_ID = "momentum_ema_crossover";

    explicit MomentumSignalService(MomentumConfig config = MomentumConfig{});

    StrategySignal generateSignal(
        const std::vector<Candle>& window,
        double current_price,
        double notional
    ) override;

    core::ServiceStatus getServiceStatus() const override;
    void setListener(core::StrategyServiceListener listener) override;
    void stop() override;

    double currentMinSpread() const;

private:
    struct PendingSignal {
        SignalAction action;
        double entry_price;
        long long exit_after;   // bar timestamp at which the trade is closed
    };

    // Returns closed-trade returns whose exit is at or before `bar`
    std::vector<double> settlePending(const Candle& bar);

    mutable std::mutex mutex_;
    MomentumConfig config_;
    core::StrategyServiceListener listener_;
    std::deque<PendingSignal> pending_;
    std::deque<double> closed_returns_;
    long long last_bar_ts_ = 0;
    int trades_since_report_ = 0;
    int total_signals_ = 0;
    long long last_update_ = 0;
    bool active_ = true;
};

} // namespace strategy
} // namespace sentinel

#pragma once

#include <vector>
#include <memory>
#include "common/Types.h"
#include "backtest/BenchmarkResult.h"
#include "core/contracts/ICalibrationService.h"
#include "core/contracts/IParameterManager.h"
#include "core/contracts/IStrategyService.h"

namespace sentinel {
namespace backtest {

// Replays bars through a strategy service and scores the simulated trades.
class BacktestEngine {
public:
    static constexpr size_t LOOKBACK_BARS = 100;
    static constexpr size_t MIN_WINDOW_BARS = 50;
    static constexpr int MAX_HOLDING_BARS = 24;
    static constexpr double DEFAULT_FEE_RATE = 0.001;

    BacktestEngine(
        std::shared_ptr<core::ICalibrationService> calibration_service,
        std::shared_ptr<core::IParameterManager> parameter_manager,
        double fee_rate = DEFAULT_FEE_RATE
    );

    // Signal failures skip the bar; collaborator failures outside the scan propagate
    BenchmarkResult run(
        const std::vector<Candle>& bars,
        core::IStrategyService& strategy,
        double notional
    );

    double getFeeRate() const { return fee_rate_; }

private:
    struct Trade {
        size_t entry_index;
        double simulated_return;
        StrategySignal signal;
    };

    double simulateTradeReturn(
        const StrategySignal& signal,
        const std::vector<Candle>& bars,
        size_t index
    ) const;

    void fillCalibrationMetrics(BenchmarkResult& result) const;

    std::shared_ptr<core::ICalibrationService> calibration_service_;
    std::shared_ptr<core::IParameterManager> parameter_manager_;
    double fee_rate_;
};

} // namespace backtest
} // namespace sentinel

#pragma once

#include <string>
#include <cstdint>

namespace sentinel {
namespace engine {

// Alert bounds for pushed performance metrics
struct PerformanceThresholds {
    double min_sharpe_ratio = 1.0;
    double max_drawdown = 0.15;
    double min_win_rate = 0.55;
    double max_calibration_error = 0.1;
};

// Harness settings (defaults match the shipped config)
struct HarnessConfig {
    bool enable_real_time_test = true;          // arm the recurring benchmark timer
    bool enable_backtest = true;                // allow benchmark runs at all
    int backtest_period_days = 30;
    long long benchmark_interval_ms = 60LL * 60 * 1000;     // 1h
    long long health_check_interval_ms = 5LL * 60 * 1000;   // 5m

    double notional_capital = 1000000.0;
    double fee_rate = 0.001;                    // per side
    int synthetic_bar_count = 1000;
    std::uint64_t random_seed = 0;              // 0: nondeterministic
    std::string history_csv_path;               // empty: synthetic bars only

    PerformanceThresholds thresholds;
};

} // namespace engine
} // namespace sentinel

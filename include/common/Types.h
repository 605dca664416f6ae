#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>

namespace sentinel {

// 1 bar = 1 hour in the benchmark replay
constexpr long long ONE_HOUR_MS = 60LL * 60LL * 1000LL;

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;    // epoch ms

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

enum class Timeframe { M1, M5, M15, M30, H1, H4, D1 };

using CandlesByTimeframe = std::map<Timeframe, std::vector<Candle>>;

enum class SignalAction { BUY, SELL, HOLD };

struct StrategySignal {
    SignalAction action;
    double strength;            // 0.0 ~ 1.0
    double confidence;          // 0.0 ~ 1.0
    double leverage;
    double stop_loss;
    double take_profit;
    long long holding_duration_ms;
    std::string strategy_id;
    std::string market_state;
    long long timestamp;

    StrategySignal()
        : action(SignalAction::HOLD)
        , strength(0.0)
        , confidence(0.0)
        , leverage(1.0)
        , stop_loss(0.0)
        , take_profit(0.0)
        , holding_duration_ms(0)
        , timestamp(0)
    {}
};

// Rolling performance pushed by the strategy service
struct PerformanceMetrics {
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;
    double win_rate = 0.0;
    double avg_return = 0.0;
    double volatility = 0.0;
    double calmar_ratio = 0.0;
    double sortino_ratio = 0.0;
    int total_trades = 0;
    double profit_factor = 0.0;
    std::optional<double> calibration_error;
};

inline long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline const char* toString(SignalAction action) {
    switch (action) {
        case SignalAction::BUY: return "BUY";
        case SignalAction::SELL: return "SELL";
        case SignalAction::HOLD: return "HOLD";
    }
    return "HOLD";
}

inline const char* toString(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1: return "1m";
        case Timeframe::M5: return "5m";
        case Timeframe::M15: return "15m";
        case Timeframe::M30: return "30m";
        case Timeframe::H1: return "1h";
        case Timeframe::H4: return "4h";
        case Timeframe::D1: return "1d";
    }
    return "1h";
}

} // namespace sentinel

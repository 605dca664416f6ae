#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "core/contracts/IMarketStateAnalyzer.h"

namespace sentinel {
namespace analytics {

enum class MarketRegime {
    UNKNOWN,
    TRENDING_UP,        // ADX >= 25, EMA20 > EMA50
    TRENDING_DOWN,
    RANGING,            // low ADX
    HIGH_VOLATILITY     // ATR above 2% of price
};

const char* toString(MarketRegime regime);

struct RegimeAnalysis {
    MarketRegime regime = MarketRegime::UNKNOWN;
    double adx = 0.0;
    double atr_pct = 0.0;       // ATR / price, percent
    double trend_score = 0.0;   // -1.0 (down) to 1.0 (up)
    std::string description;
};

// Indicator-based classifier over the 1h series (falls back to the first series present)
class MarketStateAnalyzer : public core::IMarketStateAnalyzer {
public:
    static constexpr size_t MIN_BARS = 50;

    core::MarketStateResult analyzeState(
        const CandlesByTimeframe& candles,
        double current_price,
        double volume_24h
    ) override;

    RegimeAnalysis analyzeRegime(const std::vector<Candle>& candles) const;

    core::MarketStateResult lastResult() const;

private:
    mutable std::mutex mutex_;
    core::MarketStateResult last_result_;
};

} // namespace analytics
} // namespace sentinel

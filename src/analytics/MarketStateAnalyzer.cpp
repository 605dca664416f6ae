#include "analytics/MarketStateAnalyzer.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sentinel {
namespace analytics {

const char* toString(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::TRENDING_UP: return "TRENDING_UP";
        case MarketRegime::TRENDING_DOWN: return "TRENDING_DOWN";
        case MarketRegime::RANGING: return "SIDEWAYS";
        case MarketRegime::HIGH_VOLATILITY: return "HIGH_VOLATILITY";
        case MarketRegime::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

RegimeAnalysis MarketStateAnalyzer::analyzeRegime(const std::vector<Candle>& candles) const {
    RegimeAnalysis result;

    if (candles.size() < MIN_BARS) {
        result.description = "Insufficient Data";
        return result;
    }

    double current_price = candles.back().close;
    if (current_price <= 0.0) {
        throw std::invalid_argument("non-positive close price");
    }

    double adx = TechnicalIndicators::calculateADX(candles, 14);
    double atr = TechnicalIndicators::calculateATR(candles, 14);
    double atr_pct = (atr / current_price) * 100.0;

    auto prices = TechnicalIndicators::extractClosePrices(candles);
    double ema20 = TechnicalIndicators::calculateEMA(prices, 20);
    double ema50 = TechnicalIndicators::calculateEMA(prices, 50);

    result.adx = adx;
    result.atr_pct = atr_pct;

    if (atr_pct > 2.0) {
        result.regime = MarketRegime::HIGH_VOLATILITY;
        result.description = "High Volatility (ATR > 2%)";
        return result;
    }

    bool ema_bullish = ema20 > ema50;
    double direction = ema_bullish ? 1.0 : -1.0;
    result.trend_score = direction * (adx / 100.0);

    if (adx >= 25.0) {
        result.regime = ema_bullish ? MarketRegime::TRENDING_UP : MarketRegime::TRENDING_DOWN;
        result.description = ema_bullish ? "Strong Uptrend" : "Strong Downtrend";
    } else {
        result.regime = MarketRegime::RANGING;
        result.description = "Ranging / Weak Trend";
    }

    return result;
}

core::MarketStateResult MarketStateAnalyzer::analyzeState(
    const CandlesByTimeframe& candles,
    double current_price,
    double volume_24h
) {
    if (current_price <= 0.0) {
        throw std::invalid_argument("current price must be positive");
    }

    auto it = candles.find(Timeframe::H1);
    if (it == candles.end()) {
        it = candles.begin();
    }

    core::MarketStateResult state;
    state.timestamp = nowMs();

    if (it != candles.end()) {
        const auto analysis = analyzeRegime(it->second);
        state.state = analysis.regime == MarketRegime::UNKNOWN ? "SIDEWAYS" : toString(analysis.regime);
        state.trend_score = analysis.trend_score;
        // ADX doubles as the confidence of a trend call
        state.confidence = analysis.regime == MarketRegime::UNKNOWN
            ? 0.0
            : std::min(1.0, std::max(0.3, analysis.adx / 50.0));
        LOG_DEBUG("Market state {} on {} (adx={:.1f}, atr={:.2f}%, vol24h={:.0f})",
                  state.state, toString(it->first), analysis.adx, analysis.atr_pct, volume_24h);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    last_result_ = state;
    return state;
}

core::MarketStateResult MarketStateAnalyzer::lastResult() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_result_;
}

} // namespace analytics
} // namespace sentinel

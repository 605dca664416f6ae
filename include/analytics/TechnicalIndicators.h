#pragma once

#include <vector>
#include "common/Types.h"

namespace sentinel {
namespace analytics {

class TechnicalIndicators {
public:
    // RSI (Wilder's smoothing). 70+ overbought, 30- oversold
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    // Average True Range
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);

    // Average Directional Index. 25+ trending, below 20 ranging
    static double calculateADX(const std::vector<Candle>& candles, int period = 14);

    static double calculateEMA(const std::vector<double>& prices, int period);

    // Mean of the latest `period` values
    static double calculateSMA(const std::vector<double>& prices, int period);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
};

} // namespace analytics
} // namespace sentinel

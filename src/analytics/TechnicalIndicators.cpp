#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>

namespace sentinel {
namespace analytics {

double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (prices.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }

    avg_gain /= period;
    avg_loss /= period;

    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
    }

    if (avg_loss < 0.0000001) return 100.0;

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

double TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    if (candles.size() < static_cast<size_t>(period + 1)) {
        return 0.0;
    }

    std::vector<double> tr_values;
    tr_values.reserve(candles.size());

    for (size_t i = 1; i < candles.size(); ++i) {
        const auto& current = candles[i];
        const auto& prev = candles[i - 1];

        double tr1 = current.high - current.low;
        double tr2 = std::abs(current.high - prev.close);
        double tr3 = std::abs(current.low - prev.close);

        tr_values.push_back(std::max({tr1, tr2, tr3}));
    }

    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;

    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = ((atr * (period - 1)) + tr_values[i]) / period;
    }

    return atr;
}

double TechnicalIndicators::calculateADX(const std::vector<Candle>& candles, int period) {
    if (candles.size() < static_cast<size_t>(period * 2)) return 0.0;

    std::vector<double> tr_vec, dm_plus_vec, dm_minus_vec;
    tr_vec.reserve(candles.size());
    dm_plus_vec.reserve(candles.size());
    dm_minus_vec.reserve(candles.size());

    for (size_t i = 1; i < candles.size(); ++i) {
        double prev_close = candles[i - 1].close;

        double tr1 = candles[i].high - candles[i].low;
        double tr2 = std::abs(candles[i].high - prev_close);
        double tr3 = std::abs(candles[i].low - prev_close);
        tr_vec.push_back(std::max({tr1, tr2, tr3}));

        double up_move = candles[i].high - candles[i - 1].high;
        double down_move = candles[i - 1].low - candles[i].low;

        dm_plus_vec.push_back((up_move > down_move && up_move > 0) ? up_move : 0.0);
        dm_minus_vec.push_back((down_move > up_move && down_move > 0) ? down_move : 0.0);
    }

    // Wilder's smoothing, seeded with the first-period sum
    auto smooth = [period](const std::vector<double>& vec) {
        std::vector<double> smoothed;
        if (vec.size() < static_cast<size_t>(period)) return smoothed;

        double prev = 0.0;
        for (int i = 0; i < period; ++i) prev += vec[i];
        smoothed.push_back(prev);

        for (size_t i = period; i < vec.size(); ++i) {
            prev = prev - (prev / period) + vec[i];
            smoothed.push_back(prev);
        }
        return smoothed;
    };

    auto tr_smooth = smooth(tr_vec);
    auto dm_plus_smooth = smooth(dm_plus_vec);
    auto dm_minus_smooth = smooth(dm_minus_vec);

    size_t len = std::min({tr_smooth.size(), dm_plus_smooth.size(), dm_minus_smooth.size()});
    if (len == 0) return 0.0;

    std::vector<double> dx_vec;
    dx_vec.reserve(len);
    for (size_t i = 0; i < len; ++i) {
        double tr = tr_smooth[i];
        if (tr == 0) {
            dx_vec.push_back(0.0);
            continue;
        }

        double di_plus = (dm_plus_smooth[i] / tr) * 100.0;
        double di_minus = (dm_minus_smooth[i] / tr) * 100.0;

        double sum_di = di_plus + di_minus;
        dx_vec.push_back(sum_di == 0 ? 0.0 : (std::abs(di_plus - di_minus) / sum_di) * 100.0);
    }

    if (dx_vec.size() < static_cast<size_t>(period)) return 0.0;
    return calculateSMA(dx_vec, period);
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (prices.empty()) return 0.0;
    if (prices.size() < static_cast<size_t>(period)) return prices.back();

    double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) {
        ema += prices[i];
    }
    ema /= period;

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
    }

    return ema;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }
    return prices;
}

} // namespace analytics
} // namespace sentinel

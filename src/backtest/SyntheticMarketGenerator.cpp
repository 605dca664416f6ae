#include "backtest/SyntheticMarketGenerator.h"

#include <algorithm>

namespace sentinel {
namespace backtest {

namespace {
std::uint64_t resolveSeed(std::uint64_t seed) {
    if (seed != 0) {
        return seed;
    }
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) | rd();
}
}

SyntheticMarketGenerator::SyntheticMarketGenerator(std::uint64_t seed, double start_price)
    : seed_(resolveSeed(seed))
    , start_price_(start_price)
    , rng_(seed_)
{}

double SyntheticMarketGenerator::uniform(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

std::vector<Candle> SyntheticMarketGenerator::generate(int count) {
    return generate(count, nowMs());
}

std::vector<Candle> SyntheticMarketGenerator::generate(int count, long long end_timestamp_ms) {
    std::vector<Candle> candles;
    if (count <= 0) {
        return candles;
    }
    candles.reserve(static_cast<size_t>(count));

    double price = start_price_;
    long long timestamp = end_timestamp_ms - static_cast<long long>(count) * ONE_HOUR_MS;

    for (int i = 0; i < count; ++i) {
        const double change = uniform(-0.5, 0.5) * 0.02;
        const double open = price;
        const double close = price * (1.0 + change);
        const double high = std::max(open, close) * (1.0 + uniform(0.0, 0.005));
        const double low = std::min(open, close) * (1.0 - uniform(0.0, 0.005));
        const double volume = 1000000.0 + uniform(0.0, 500000.0);

        candles.emplace_back(open, high, low, close, volume, timestamp);

        price = close;
        timestamp += ONE_HOUR_MS;
    }

    return candles;
}

} // namespace backtest
} // namespace sentinel

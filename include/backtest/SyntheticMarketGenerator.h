#pragma once

#include <cstdint>
#include <random>
#include <vector>
#include "common/Types.h"

namespace sentinel {
namespace backtest {

// Hourly random-walk bars used when no recorded history is available.
// Each bar moves the close by up to +/-1% and widens high/low by up to 0.5%.
class SyntheticMarketGenerator {
public:
    // seed == 0 draws a seed from std::random_device
    explicit SyntheticMarketGenerator(std::uint64_t seed = 0, double start_price = 100.0);

    // Exactly `count` hourly bars, the first one stamped count hours before end_timestamp_ms
    std::vector<Candle> generate(int count, long long end_timestamp_ms);
    std::vector<Candle> generate(int count);

    std::uint64_t seed() const { return seed_; }

private:
    double uniform(double lo, double hi);

    std::uint64_t seed_;
    double start_price_;
    std::mt19937_64 rng_;
};

} // namespace backtest
} // namespace sentinel

#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace sentinel {
namespace backtest {

class DataHistory {
public:
    // Expected format: timestamp,open,high,low,close,volume (header rows are skipped)
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Array of {timestamp|t, open|o, high|h, low|l, close|c, volume|v}
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Keep the trailing `days` of history, measured from the newest bar
    static std::vector<Candle> filterByPeriod(const std::vector<Candle>& candles, int days);

private:
    static long long toMsTimestamp(long long ts);
};

} // namespace backtest
} // namespace sentinel

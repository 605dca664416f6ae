#include "backtest/DataHistory.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>

namespace sentinel {
namespace backtest {

namespace {
std::string normalizeCell(std::string s) {
    auto trim = [](std::string v) {
        while (!v.empty() && std::isspace(static_cast<unsigned char>(v.front()))) {
            v.erase(v.begin());
        }
        while (!v.empty() && std::isspace(static_cast<unsigned char>(v.back()))) {
            v.pop_back();
        }
        return v;
    };

    s = trim(std::move(s));

    // UTF-8 BOM on the first cell
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::optional<double> numberField(const nlohmann::json& item, const char* key, const char* short_key) {
    if (item.contains(key)) return item[key].get<double>();
    if (item.contains(short_key)) return item[short_key].get<double>();
    return std::nullopt;
}

bool hasUsableClose(const Candle& candle) {
    return std::isfinite(candle.close) && candle.close > 0.0;
}

void sortByTimestamp(std::vector<Candle>& candles) {
    std::sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
}
}

long long DataHistory::toMsTimestamp(long long ts) {
    // Second-resolution stamps are below 1e11 until year 5138
    return (ts > 0 && ts < 100000000000LL) ? ts * 1000LL : ts;
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6 || row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // header or malformed row
            continue;
        }

        try {
            Candle candle(
                std::stod(row[1]), std::stod(row[2]), std::stod(row[3]),
                std::stod(row[4]), std::stod(row[5]), toMsTimestamp(std::stoll(row[0]))
            );
            if (!hasUsableClose(candle)) {
                LOG_WARN("Dropping row with non-positive close: {}", line);
                continue;
            }
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    sortByTimestamp(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    try {
        nlohmann::json j;
        file >> j;
        size_t index = 0;
        for (const auto& item : j) {
            const size_t row = index++;
            Candle candle;
            if (item.contains("timestamp")) candle.timestamp = item["timestamp"].get<long long>();
            else if (item.contains("t")) candle.timestamp = item["t"].get<long long>();
            else {
                LOG_WARN("Dropping bar {} without timestamp", row);
                continue;
            }
            candle.timestamp = toMsTimestamp(candle.timestamp);

            const auto open = numberField(item, "open", "o");
            const auto high = numberField(item, "high", "h");
            const auto low = numberField(item, "low", "l");
            const auto close = numberField(item, "close", "c");
            if (!open || !high || !low || !close) {
                LOG_WARN("Dropping bar {} with missing price fields", row);
                continue;
            }
            candle.open = *open;
            candle.high = *high;
            candle.low = *low;
            candle.close = *close;
            candle.volume = numberField(item, "volume", "v").value_or(0.0);

            if (!hasUsableClose(candle)) {
                LOG_WARN("Dropping bar {} with non-positive close", row);
                continue;
            }
            candles.push_back(candle);
        }
        sortByTimestamp(candles);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::filterByPeriod(const std::vector<Candle>& candles, int days) {
    if (candles.empty() || days <= 0) {
        return candles;
    }

    const long long cutoff = candles.back().timestamp - static_cast<long long>(days) * 24LL * ONE_HOUR_MS;
    auto first = std::find_if(candles.begin(), candles.end(), [cutoff](const Candle& c) {
        return c.timestamp > cutoff;
    });
    return std::vector<Candle>(first, candles.end());
}

} // namespace backtest
} // namespace sentinel

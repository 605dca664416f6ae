#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace sentinel {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

void validate(const engine::HarnessConfig& c) {
    if (c.benchmark_interval_ms <= 0) {
        throw ConfigError("benchmark_interval_ms must be positive");
    }
    if (c.health_check_interval_ms <= 0) {
        throw ConfigError("health_check_interval_ms must be positive");
    }
    if (c.backtest_period_days <= 0) {
        throw ConfigError("backtest_period_days must be positive");
    }
    if (c.synthetic_bar_count <= 0) {
        throw ConfigError("synthetic_bar_count must be positive");
    }
    if (c.fee_rate < 0.0) {
        throw ConfigError("fee_rate must not be negative");
    }
    if (c.notional_capital <= 0.0) {
        throw ConfigError("notional_capital must be positive");
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

engine::HarnessConfig Config::parseHarnessConfig(const nlohmann::json& j) {
    engine::HarnessConfig c;
    if (!j.is_object()) {
        validate(c);
        return c;
    }

    try {
        c.enable_real_time_test = j.value("enable_real_time_test", c.enable_real_time_test);
        c.enable_backtest = j.value("enable_backtest", c.enable_backtest);
        c.backtest_period_days = j.value("backtest_period_days", c.backtest_period_days);
        c.benchmark_interval_ms = j.value("benchmark_interval_ms", c.benchmark_interval_ms);
        c.health_check_interval_ms = j.value("health_check_interval_ms", c.health_check_interval_ms);
        c.notional_capital = j.value("notional_capital", c.notional_capital);
        c.fee_rate = j.value("fee_rate", c.fee_rate);
        c.synthetic_bar_count = j.value("synthetic_bar_count", c.synthetic_bar_count);
        c.random_seed = j.value("random_seed", c.random_seed);
        c.history_csv_path = trimCopy(j.value("history_csv_path", c.history_csv_path));

        if (j.contains("performance_thresholds")) {
            const auto& t = j["performance_thresholds"];
            c.thresholds.min_sharpe_ratio = t.value("min_sharpe_ratio", c.thresholds.min_sharpe_ratio);
            c.thresholds.max_drawdown = t.value("max_drawdown", c.thresholds.max_drawdown);
            c.thresholds.min_win_rate = t.value("min_win_rate", c.thresholds.min_win_rate);
            c.thresholds.max_calibration_error =
                t.value("max_calibration_error", c.thresholds.max_calibration_error);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(e.what());
    }

    validate(c);
    return c;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path(path);
    if (!config_path.is_absolute() && !std::filesystem::exists(config_path)) {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "Config path: " << config_path << std::endl;

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cout << "Warning: config file not found, using defaults" << std::endl;
    } else {
        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError(std::string("cannot parse ") + config_path.string() + ": " + e.what());
        }
        if (!j.is_object()) {
            throw ConfigError(config_path.string() + ": top level must be an object");
        }

        harness_config_ = parseHarnessConfig(j.value("harness", nlohmann::json::object()));

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            try {
                log_dir_ = trimCopy(l.value("log_dir", log_dir_));
                log_level_ = trimCopy(l.value("log_level", log_level_));
            } catch (const nlohmann::json::exception& e) {
                throw ConfigError(e.what());
            }
        }
    }

    const std::string env_level = readEnvVar("SENTINEL_LOG_LEVEL");
    if (!env_level.empty()) {
        log_level_ = env_level;
    }

    std::cout << "Config loaded: RealTimeTest=" << harness_config_.enable_real_time_test
              << ", BenchmarkInterval=" << harness_config_.benchmark_interval_ms << "ms"
              << ", HealthInterval=" << harness_config_.health_check_interval_ms << "ms" << std::endl;
}

} // namespace sentinel

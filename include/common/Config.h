#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/HarnessConfig.h"

namespace sentinel {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);

    engine::HarnessConfig getHarnessConfig() const { return harness_config_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getLogLevel() const { return log_level_; }

    // Merge the "harness" section over defaults; throws ConfigError on invalid values
    static engine::HarnessConfig parseHarnessConfig(const nlohmann::json& j);

private:
    Config() = default;

    engine::HarnessConfig harness_config_;
    std::string log_dir_ = "logs";
    std::string log_level_ = "info";
};

} // namespace sentinel

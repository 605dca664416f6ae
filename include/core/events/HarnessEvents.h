#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace sentinel {
namespace core {

enum class HarnessEventType {
    SYSTEM_INITIALIZED,
    PERFORMANCE_EVALUATED,
    BENCHMARK_COMPLETED,
    ERROR_EVENT,
    WARNING
};

// Wire names: system_initialized, performance_evaluated, ...
const char* toString(HarnessEventType type);

struct ErrorEvent {
    std::optional<std::string> component;
    std::string error;
    std::optional<std::string> context;
};

struct WarningEvent {
    std::string type;                   // "performance_threshold"
    std::vector<std::string> warnings;
    PerformanceMetrics metrics;
};

nlohmann::json toJson(const PerformanceMetrics& metrics);
nlohmann::json toJson(const ErrorEvent& event);
nlohmann::json toJson(const WarningEvent& event);

} // namespace core
} // namespace sentinel

#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "core/events/EventBus.h"
#include "engine/HarnessConfig.h"

namespace sentinel {
namespace engine {

class ThresholdAlerter {
public:
    static constexpr const char* WARNING_TYPE = "performance_threshold";

    ThresholdAlerter(PerformanceThresholds thresholds, core::EventBus& events);

    // Publishes one WARNING bundling every violated bound; returns the messages
    std::vector<std::string> evaluate(const PerformanceMetrics& metrics);

    static std::vector<std::string> collectWarnings(
        const PerformanceMetrics& metrics,
        const PerformanceThresholds& thresholds
    );

    const PerformanceThresholds& thresholds() const { return thresholds_; }

private:
    const PerformanceThresholds thresholds_;
    core::EventBus& events_;
};

} // namespace engine
} // namespace sentinel

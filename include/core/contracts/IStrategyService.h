#pragma once

#include <functional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/model/CollaboratorTypes.h"

namespace sentinel {
namespace core {

// Notifications raised by the strategy service; any of them may be empty
struct StrategyServiceListener {
    std::function<void(const std::string&)> on_error;
    std::function<void(const PerformanceMetrics&)> on_performance_updated;
    std::function<void(const ParameterAdjustment&)> on_parameters_adjusted;
};

class IStrategyService {
public:
    virtual ~IStrategyService() = default;

    // May throw; callers treat a throw as "no signal for this bar"
    virtual StrategySignal generateSignal(
        const std::vector<Candle>& window,
        double current_price,
        double notional
    ) = 0;

    virtual ServiceStatus getServiceStatus() const = 0;
    virtual void setListener(StrategyServiceListener listener) = 0;
    virtual void stop() {}
};

} // namespace core
} // namespace sentinel

#pragma once

#include "common/Types.h"
#include "core/model/CollaboratorTypes.h"

namespace sentinel {
namespace core {

class IMarketStateAnalyzer {
public:
    virtual ~IMarketStateAnalyzer() = default;

    virtual MarketStateResult analyzeState(
        const CandlesByTimeframe& candles,
        double current_price,
        double volume_24h
    ) = 0;
};

} // namespace core
} // namespace sentinel

#pragma once

#include <memory>

#include "core/contracts/ICalibrationService.h"
#include "core/contracts/IHotUpdateService.h"
#include "core/contracts/IMarketStateAnalyzer.h"
#include "core/contracts/IParameterManager.h"
#include "core/contracts/IStrategyService.h"

namespace sentinel {
namespace core {

// The five services watched by the harness
struct Collaborators {
    std::shared_ptr<IMarketStateAnalyzer> market_state_analyzer;
    std::shared_ptr<IParameterManager> parameter_manager;
    std::shared_ptr<ICalibrationService> calibration_service;
    std::shared_ptr<IHotUpdateService> hot_update_service;
    std::shared_ptr<IStrategyService> strategy_service;
};

} // namespace core
} // namespace sentinel

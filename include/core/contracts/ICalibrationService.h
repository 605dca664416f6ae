#pragma once

#include "core/model/CollaboratorTypes.h"

namespace sentinel {
namespace core {

class ICalibrationService {
public:
    virtual ~ICalibrationService() = default;

    virtual CalibrationStatus getStatus() const = 0;
    virtual CalibrationPerformanceMap getCalibrationPerformance() const = 0;
    virtual void stop() {}
};

} // namespace core
} // namespace sentinel

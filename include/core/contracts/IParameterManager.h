#pragma once

#include "core/model/CollaboratorTypes.h"

namespace sentinel {
namespace core {

class IParameterManager {
public:
    virtual ~IParameterManager() = default;

    virtual AdaptiveParameters getCurrentParameters() const = 0;
    virtual ParameterStats getParameterStats() const = 0;
};

} // namespace core
} // namespace sentinel

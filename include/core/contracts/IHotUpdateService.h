#pragma once

#include <functional>
#include <string>

#include "core/model/CollaboratorTypes.h"

namespace sentinel {
namespace core {

class IHotUpdateService {
public:
    using ErrorHandler = std::function<void(const std::string&)>;

    virtual ~IHotUpdateService() = default;

    virtual ServiceStatus getServiceStatus() const = 0;
    // Handler may be invoked from any thread
    virtual void setErrorHandler(ErrorHandler handler) = 0;
    virtual void stop() {}
};

} // namespace core
} // namespace sentinel

#pragma once

namespace sentinel {
namespace utils {

class ProcessStats {
public:
    // Resident set size over physical memory, 0.0 when /proc is unavailable
    static double memoryUsageRatio();
};

} // namespace utils
} // namespace sentinel

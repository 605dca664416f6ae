#include "common/ProcessStats.h"

#include <fstream>
#include <unistd.h>

namespace sentinel {
namespace utils {

double ProcessStats::memoryUsageRatio() {
    std::ifstream statm("/proc/self/statm");
    if (!statm.is_open()) {
        return 0.0;
    }

    long long total_pages = 0;
    long long resident_pages = 0;
    if (!(statm >> total_pages >> resident_pages)) {
        return 0.0;
    }

    const long phys_pages = sysconf(_SC_PHYS_PAGES);
    if (phys_pages <= 0) {
        return 0.0;
    }
    return static_cast<double>(resident_pages) / static_cast<double>(phys_pages);
}

} // namespace utils
} // namespace sentinel

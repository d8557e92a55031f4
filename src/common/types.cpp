// =============================================================================
// fq-stat - Common Type Definitions Implementation
// =============================================================================

#include "fqs/common/types.h"

#include <algorithm>
#include <thread>

namespace fqs {

std::size_t recommendedThreadCount() noexcept {
    auto hwThreads = std::thread::hardware_concurrency();
    if (hwThreads == 0) {
        return 4;
    }
    return std::min<std::size_t>(hwThreads, 32);
}

}  // namespace fqs

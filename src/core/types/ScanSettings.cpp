#include "core/types/ScanSettings.hpp"

#include "core/Errors.hpp"

#include <string>

namespace portprobe::core {

void ScannerSettings::validate() const {
    if (concurrency <= 0) {
        throw InvalidConfiguration("Worker pool size must be at least 1 (got " +
                                   std::to_string(concurrency) + ")");
    }
    if (timeoutMs <= 0) {
        throw InvalidConfiguration("Probe timeout must be positive (got " +
                                   std::to_string(timeoutMs) + " ms)");
    }
}

} // namespace portprobe::core

/**
 * @file ScanSettings.hpp
 * @brief Tunable parameters of a scan.
 */

#pragma once

#include <chrono>

namespace portprobe::core {

/**
 * @brief Worker-pool size and per-probe timeout, fixed for a whole scan.
 */
struct ScannerSettings {
    static constexpr int kDefaultConcurrency = 50;
    static constexpr int kDefaultTimeoutMs = 1000;

    int concurrency{kDefaultConcurrency}; ///< Maximum probes in flight at once
    int timeoutMs{kDefaultTimeoutMs};     ///< Connect timeout per probe in milliseconds

    /**
     * @brief Returns the per-probe timeout as a duration.
     */
    [[nodiscard]] std::chrono::milliseconds timeout() const {
        return std::chrono::milliseconds(timeoutMs);
    }

    /**
     * @brief Checks that the settings can be used for a scan.
     * @throws InvalidConfiguration if concurrency or timeout is not positive.
     */
    void validate() const;

    bool operator==(const ScannerSettings& other) const = default;
};

} // namespace portprobe::core

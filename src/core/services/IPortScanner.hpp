/**
 * @file IPortScanner.hpp
 * @brief Interface for the port scanning service.
 *
 * This file defines the abstract interface for scanning a sequence of TCP
 * ports on one host and tracking scan progress.
 */

#pragma once

#include "core/types/ScanReport.hpp"

#include <functional>
#include <string>
#include <vector>

namespace portprobe::core {

/**
 * @brief Progress information during a port scan operation.
 */
struct ScanProgress {
    int totalPorts{0};   ///< Total number of ports to scan
    int scannedPorts{0}; ///< Number of ports scanned so far
    int openPorts{0};    ///< Number of open ports found

    /**
     * @brief Calculates the completion percentage.
     * @return Percentage of ports scanned (0-100).
     */
    [[nodiscard]] double percentComplete() const {
        return totalPorts > 0 ? (static_cast<double>(scannedPorts) / totalPorts) * 100.0 : 0.0;
    }
};

/**
 * @brief Interface for port scanning service.
 *
 * A scan probes every requested port exactly once with bounded parallelism
 * and blocks until all probes have finished.
 */
class IPortScanner {
public:
    /**
     * @brief Callback function type for open ports, invoked as each is found.
     * @param outcome The outcome of an open port.
     */
    using ResultCallback = std::function<void(const ProbeOutcome&)>;

    /**
     * @brief Callback function type for progress updates.
     * @param progress Current scan progress information.
     */
    using ProgressCallback = std::function<void(const ScanProgress&)>;

    virtual ~IPortScanner() = default;

    /**
     * @brief Scans the given ports and builds the report.
     *
     * Callbacks are invoked from worker threads, one at a time.
     *
     * @param host Target IP address or hostname.
     * @param ports Ports to probe, in dispatch order.
     * @param concurrency Maximum number of probes in flight.
     * @param onResult Called for every open port (may be empty).
     * @param onProgress Called after every completed probe (may be empty).
     * @return The completed scan report.
     * @throws InvalidConfiguration if concurrency is not positive.
     */
    virtual ScanReport scan(const std::string& host, const std::vector<int>& ports,
                            int concurrency, ResultCallback onResult,
                            ProgressCallback onProgress) = 0;

    /**
     * @brief Scans the given ports without observers.
     */
    ScanReport scan(const std::string& host, const std::vector<int>& ports, int concurrency) {
        return scan(host, ports, concurrency, nullptr, nullptr);
    }
};

} // namespace portprobe::core

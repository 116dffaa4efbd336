#pragma once

#include "core/services/IPortProber.hpp"
#include "core/services/IPortScanner.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace portprobe::infra {

/**
 * @brief Concurrent TCP port scanner.
 *
 * Dispatches one probe per port onto a pool of `concurrency` worker threads
 * (an AsioContext) and folds outcomes into a ScanReport as they complete.
 * The report is the only shared state and is guarded by a mutex. Observers
 * run outside that mutex, one at a time and in report order, so a slow
 * observer does not hold up report updates from other workers.
 * Implements the core::IPortScanner interface.
 */
class PortScanner : public core::IPortScanner {
public:
    /**
     * @brief Constructs a PortScanner.
     * @param prober Prober used for every port; must outlive the scanner.
     * @param timeout Connect timeout applied to every probe of a scan.
     */
    PortScanner(core::IPortProber& prober, std::chrono::milliseconds timeout);

    using core::IPortScanner::scan;

    /**
     * @brief Scans the given ports on host.
     *
     * Records the scan time before dispatching, probes every port exactly once
     * with at most `concurrency` probes in flight and returns only after all
     * of them have finished. Open ports appear in completion order.
     *
     * @param host Target IP address or hostname.
     * @param ports Ports to probe.
     * @param concurrency Worker pool size (must be >= 1).
     * @param onResult Callback invoked for each open port.
     * @param onProgress Callback invoked after each probe.
     * @return The completed report.
     * @throws core::InvalidConfiguration if concurrency < 1.
     */
    core::ScanReport scan(const std::string& host, const std::vector<int>& ports,
                          int concurrency, ResultCallback onResult,
                          ProgressCallback onProgress) override;

private:
    void recordOutcome(const core::ProbeOutcome& outcome, core::ScanReport& report,
                       core::ScanProgress& progress, const ResultCallback& onResult,
                       const ProgressCallback& onProgress);

    core::IPortProber& prober_;
    std::chrono::milliseconds timeout_;
    std::mutex reportMutex_;
    std::uint64_t nextObserverTicket_{0}; ///< Guarded by reportMutex_
    std::mutex observerMutex_;
    std::condition_variable observerTurn_;
    std::uint64_t servedObserverTicket_{0}; ///< Guarded by observerMutex_
};

} // namespace portprobe::infra

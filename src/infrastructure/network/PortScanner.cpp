#include "infrastructure/network/PortScanner.hpp"

#include "core/Errors.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace portprobe::infra {

PortScanner::PortScanner(core::IPortProber& prober, std::chrono::milliseconds timeout)
    : prober_(prober), timeout_(timeout) {}

core::ScanReport PortScanner::scan(const std::string& host, const std::vector<int>& ports,
                                   int concurrency, ResultCallback onResult,
                                   ProgressCallback onProgress) {
    if (concurrency < 1) {
        throw core::InvalidConfiguration("Worker pool size must be at least 1 (got " +
                                         std::to_string(concurrency) + ")");
    }

    core::ScanReport report;
    report.host = host;
    report.scanTime =
        std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());

    core::ScanProgress progress;
    progress.totalPorts = static_cast<int>(ports.size());

    spdlog::info("Starting port scan of {} on {} ports ({} workers, {} ms timeout)", host,
                 ports.size(), concurrency, timeout_.count());

    if (ports.empty()) {
        return report;
    }

    // One thread per worker; never more workers than ports.
    AsioContext workers(std::min(static_cast<size_t>(concurrency), ports.size()));
    workers.start();

    for (int port : ports) {
        workers.post([this, &host, port, &report, &progress, &onResult, &onProgress]() {
            core::ProbeOutcome outcome;
            try {
                outcome = prober_.probe(host, port, timeout_);
            } catch (const std::exception& e) {
                spdlog::debug("Probe of {}:{} failed - {}", host, port, e.what());
                outcome = core::ProbeOutcome{};
                outcome.port = port;
            } catch (...) {
                spdlog::debug("Probe of {}:{} failed with a non-standard exception", host, port);
                outcome = core::ProbeOutcome{};
                outcome.port = port;
            }
            recordOutcome(outcome, report, progress, onResult, onProgress);
        });
    }

    workers.join();

    spdlog::info("Port scan of {} complete: {} open, {} closed", host, report.openPorts.size(),
                 report.closedCount);
    return report;
}

void PortScanner::recordOutcome(const core::ProbeOutcome& outcome, core::ScanReport& report,
                                core::ScanProgress& progress, const ResultCallback& onResult,
                                const ProgressCallback& onProgress) {
    std::unique_lock reportLock(reportMutex_);

    if (outcome.isOpen()) {
        report.openPorts.push_back(outcome);
        ++progress.openPorts;
    } else {
        ++report.closedCount;
    }
    ++progress.scannedPorts;

    if (!onResult && !onProgress) {
        return;
    }

    // Observers are served in ticket order, which is report order.
    core::ScanProgress snapshot = progress;
    std::uint64_t ticket = nextObserverTicket_++;
    reportLock.unlock();

    std::unique_lock observerLock(observerMutex_);
    observerTurn_.wait(observerLock, [this, ticket] { return servedObserverTicket_ == ticket; });

    try {
        if (onResult && outcome.isOpen()) {
            onResult(outcome);
        }
        if (onProgress) {
            onProgress(snapshot);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Scan observer failed for port {}: {}", outcome.port, e.what());
    } catch (...) {
        spdlog::warn("Scan observer failed for port {} with a non-standard exception",
                     outcome.port);
    }

    ++servedObserverTicket_;
    observerLock.unlock();
    observerTurn_.notify_all();
}

} // namespace portprobe::infra

#pragma once

#include "core/types/ScanReport.hpp"

#include <cstddef>
#include <ostream>
#include <string>

namespace portprobe::app {

/**
 * @brief Human-readable console output for a scan.
 */
class ReportPrinter {
public:
    /**
     * @brief Creates a printer writing to the given stream.
     * @param out Destination stream; must outlive the printer.
     */
    explicit ReportPrinter(std::ostream& out) : out_(out) {}

    /**
     * @brief Prints the target host and how many ports will be scanned.
     */
    void printScanStart(const std::string& host, std::size_t portCount);

    /**
     * @brief Prints one open port as soon as it is found.
     *
     * Called from scan worker threads, one call at a time.
     */
    void printOpenPort(const core::ProbeOutcome& outcome);

    /**
     * @brief Prints the summary block: host, scan time, counts and open ports.
     */
    void printSummary(const core::ScanReport& report);

    /**
     * @brief Prints where the JSON report was written.
     */
    void printSaved(const std::string& path);

    /**
     * @brief Service label for display: the catalog name or "Unknown".
     */
    static std::string serviceLabel(const core::ProbeOutcome& outcome);

private:
    std::ostream& out_;
};

} // namespace portprobe::app

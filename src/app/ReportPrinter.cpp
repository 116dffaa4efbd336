#include "app/ReportPrinter.hpp"

#include <string>

namespace portprobe::app {

namespace {

const std::string kRule(60, '=');

} // namespace

void ReportPrinter::printScanStart(const std::string& host, std::size_t portCount) {
    out_ << "\n[*] Scanning " << host << "...\n"
         << "[*] Ports to scan: " << portCount << "\n\n";
}

void ReportPrinter::printOpenPort(const core::ProbeOutcome& outcome) {
    out_ << "[+] Port " << outcome.port << "/tcp OPEN - " << serviceLabel(outcome) << '\n';
}

void ReportPrinter::printSummary(const core::ScanReport& report) {
    out_ << '\n'
         << kRule << '\n'
         << "  SCAN SUMMARY\n"
         << kRule << '\n'
         << "  Host: " << report.host << '\n'
         << "  Scan Time: " << core::formatTimestamp(report.scanTime) << '\n'
         << "  Open Ports: " << report.openPorts.size() << '\n'
         << "  Closed Ports: " << report.closedCount << '\n';

    if (!report.openPorts.empty()) {
        out_ << "\n  Open Ports:\n";
        for (const auto& outcome : report.openPorts) {
            out_ << "    - " << outcome.port << "/tcp (" << serviceLabel(outcome) << ")\n";
        }
    }

    out_ << kRule << "\n\n";
}

void ReportPrinter::printSaved(const std::string& path) {
    out_ << "[+] Results saved to " << path << '\n';
}

std::string ReportPrinter::serviceLabel(const core::ProbeOutcome& outcome) {
    return outcome.service.value_or("Unknown");
}

} // namespace portprobe::app

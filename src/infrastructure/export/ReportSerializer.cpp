#include "infrastructure/export/ReportSerializer.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace portprobe::infra {

nlohmann::json ReportSerializer::toJsonObject(const core::ScanReport& report) {
    nlohmann::json j;

    j["host"] = report.host;
    j["scan_time"] = core::formatTimestamp(report.scanTime);
    j["open_ports"] = nlohmann::json::array();

    for (const auto& outcome : report.openPorts) {
        nlohmann::json entry;
        entry["port"] = outcome.port;
        entry["status"] = outcome.stateToString();
        if (outcome.service) {
            entry["service"] = *outcome.service;
        } else {
            entry["service"] = nullptr;
        }
        j["open_ports"].push_back(entry);
    }

    j["closed_ports"] = report.closedCount;
    return j;
}

std::string ReportSerializer::toJson(const core::ScanReport& report, int indent) {
    return toJsonObject(report).dump(indent);
}

core::ScanReport ReportSerializer::fromJsonObject(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw core::ReportFormatError("Scan report must be a JSON object");
    }

    core::ScanReport report;
    try {
        report.host = j.at("host").get<std::string>();

        auto scanTime = j.at("scan_time").get<std::string>();
        auto parsed = core::parseTimestamp(scanTime);
        if (!parsed) {
            throw core::ReportFormatError("Invalid scan_time '" + scanTime + "'");
        }
        report.scanTime = *parsed;

        const auto& openPorts = j.at("open_ports");
        if (!openPorts.is_array()) {
            throw core::ReportFormatError("open_ports must be an array");
        }
        for (const auto& entry : openPorts) {
            core::ProbeOutcome outcome;
            outcome.port = entry.at("port").get<int>();

            auto status = entry.at("status").get<std::string>();
            auto state = core::ProbeOutcome::stateFromString(status);
            if (!state) {
                throw core::ReportFormatError("Invalid port status '" + status + "'");
            }
            outcome.state = *state;

            if (entry.contains("service") && !entry["service"].is_null()) {
                outcome.service = entry["service"].get<std::string>();
            }
            report.openPorts.push_back(outcome);
        }

        report.closedCount = j.at("closed_ports").get<int>();
    } catch (const nlohmann::json::exception& e) {
        throw core::ReportFormatError(std::string("Malformed scan report: ") + e.what());
    }

    return report;
}

core::ScanReport ReportSerializer::fromJson(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw core::ReportFormatError(std::string("Scan report is not valid JSON: ") + e.what());
    }
    return fromJsonObject(j);
}

void ReportSerializer::writeToFile(const core::ScanReport& report,
                                   const std::filesystem::path& path, int indent) {
    auto text = toJson(report, indent);

    std::ofstream file(path);
    if (!file) {
        throw core::OutputWriteFailure("Failed to open " + path.string() + " for writing");
    }

    file << text << '\n';
    file.flush();
    if (!file) {
        throw core::OutputWriteFailure("Failed to write scan report to " + path.string());
    }

    spdlog::debug("Saved scan report to {}", path.string());
}

core::ScanReport ReportSerializer::readFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw core::ReportFormatError("Failed to open " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return fromJson(oss.str());
}

} // namespace portprobe::infra

#pragma once

#include "core/types/ScanReport.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace portprobe::infra {

/**
 * @brief Converts scan reports to and from their persisted JSON form.
 *
 * Document layout:
 * @code
 * {
 *   "host": "10.0.0.1",
 *   "scan_time": "2024-05-01T12:30:45.123Z",
 *   "open_ports": [ { "port": 22, "status": "open", "service": "SSH" } ],
 *   "closed_ports": 15
 * }
 * @endcode
 * A port without a catalog entry has "service": null. open_ports keeps the
 * report's completion order in both directions.
 */
class ReportSerializer {
public:
    /**
     * @brief Builds the JSON document for a report.
     * @param report Report to convert.
     * @return JSON object.
     */
    static nlohmann::json toJsonObject(const core::ScanReport& report);

    /**
     * @brief Serializes a report as indented JSON text.
     * @param report Report to serialize.
     * @param indent Spaces per indentation level.
     * @return JSON text.
     */
    static std::string toJson(const core::ScanReport& report, int indent = 2);

    /**
     * @brief Rebuilds a report from a JSON document.
     * @param j JSON object produced by toJsonObject().
     * @return The decoded report.
     * @throws core::ReportFormatError if a field is missing or has the wrong type.
     */
    static core::ScanReport fromJsonObject(const nlohmann::json& j);

    /**
     * @brief Parses JSON text into a report.
     * @param text JSON text produced by toJson().
     * @return The decoded report.
     * @throws core::ReportFormatError if the text is not a valid report.
     */
    static core::ScanReport fromJson(const std::string& text);

    /**
     * @brief Writes the serialized report to a file, replacing it if present.
     * @param report Report to persist.
     * @param path Destination file.
     * @param indent Spaces per indentation level.
     * @throws core::OutputWriteFailure if the file cannot be written.
     */
    static void writeToFile(const core::ScanReport& report, const std::filesystem::path& path,
                            int indent = 2);

    /**
     * @brief Reads a report previously written by writeToFile().
     * @param path Source file.
     * @return The decoded report.
     * @throws core::ReportFormatError if the file cannot be read or decoded.
     */
    static core::ScanReport readFromFile(const std::filesystem::path& path);
};

} // namespace portprobe::infra

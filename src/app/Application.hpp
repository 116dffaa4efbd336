#pragma once

#include "app/CommandLine.hpp"
#include "core/types/ScanReport.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace portprobe::app {

/**
 * @brief Command-line application: configuration, logging, scan and output.
 *
 * Settings are layered: built-in defaults, then the optional JSON config
 * file, then command-line flags.
 */
class Application {
public:
    /**
     * @brief Creates the application for one invocation.
     * @param options Parsed command-line options.
     * @param out Stream receiving the human-readable report.
     */
    Application(CommandLineOptions options, std::ostream& out);

    /**
     * @brief Runs the scan described by the options.
     *
     * Prints open ports as they are found and a summary at the end, then
     * saves the JSON report if an output path was given.
     *
     * @return Process exit code (0 on success).
     * @throws core::InvalidPortSpec if the port specification is malformed.
     * @throws core::InvalidConfiguration if a setting is out of range.
     * @throws core::OutputWriteFailure if the report cannot be saved.
     */
    int run();

    /**
     * @brief Returns the effective configuration after layering.
     */
    const infra::AppConfig& config() const { return config_; }

    /**
     * @brief Returns the report of the last completed scan, if any.
     */
    const std::optional<core::ScanReport>& lastReport() const { return lastReport_; }

private:
    void loadConfiguration();
    void initializeLogging(const std::string& levelName, const std::string& logFile);

    CommandLineOptions options_;
    std::ostream& out_;
    infra::AppConfig config_;
    std::optional<core::ScanReport> lastReport_;
};

} // namespace portprobe::app

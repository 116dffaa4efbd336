#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace portprobe::app {

/**
 * @brief Options given on the command line.
 *
 * Unset optionals fall back to the configuration file, then to built-in
 * defaults.
 */
struct CommandLineOptions {
    std::string target;                    ///< Host to scan (-t, required)
    std::optional<std::string> ports;      ///< Port specification (-p)
    std::optional<std::string> outputPath; ///< JSON report destination (-o)
    std::optional<int> threads;            ///< Worker pool size (--threads)
    std::optional<int> timeoutMs;          ///< Probe timeout in ms (--timeout)
    std::optional<std::string> configPath; ///< JSON configuration file (--config)
    std::optional<std::string> logLevel;   ///< spdlog level name (--log-level)
    std::optional<std::string> logFile;    ///< Log file path (--log-file)
    bool showHelp{false};                  ///< -h / --help was given
};

/**
 * @brief Parses argv with getopt_long.
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return Parsed options. Validation of values is left to the caller.
 * @throws core::UsageError on unknown options, missing values or a missing target.
 */
CommandLineOptions parseCommandLine(int argc, char* argv[]);

/**
 * @brief Writes the usage text.
 * @param out Destination stream.
 * @param programName Name shown in the usage line.
 */
void printUsage(std::ostream& out, const std::string& programName);

} // namespace portprobe::app

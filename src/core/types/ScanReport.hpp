/**
 * @file ScanReport.hpp
 * @brief Per-port probe outcomes and the aggregate scan report.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace portprobe::core {

/**
 * @brief State of a probed port.
 *
 * Closed covers refusal, timeout, unreachable hosts and any other socket error.
 */
enum class PortState : int {
    Open = 1,  ///< A TCP connection was established
    Closed = 2 ///< No connection could be established
};

/**
 * @brief Result of probing a single port.
 */
struct ProbeOutcome {
    int port{0};                        ///< Port number that was probed
    PortState state{PortState::Closed}; ///< Observed state of the port
    std::optional<std::string> service; ///< Catalog service name, only for open ports

    /**
     * @brief Checks whether the port accepted the connection.
     * @return True if the state is Open.
     */
    [[nodiscard]] bool isOpen() const { return state == PortState::Open; }

    /**
     * @brief Converts this outcome's state to a string.
     * @return "open" or "closed".
     */
    [[nodiscard]] std::string stateToString() const;

    /**
     * @brief Converts a PortState enum to its wire string.
     * @param state The port state to convert.
     * @return "open" or "closed".
     */
    static std::string portStateToString(PortState state);

    /**
     * @brief Parses a wire string into a PortState.
     * @param str "open" or "closed".
     * @return The state, or nullopt for any other string.
     */
    static std::optional<PortState> stateFromString(const std::string& str);

    bool operator==(const ProbeOutcome& other) const = default;
};

/**
 * @brief Aggregate result of scanning one host.
 *
 * Only open outcomes are kept individually, in the order their probes
 * completed. Every other probe is folded into closedCount.
 */
struct ScanReport {
    std::string host;                             ///< Target exactly as supplied
    std::chrono::system_clock::time_point scanTime; ///< Taken once, at scan start
    std::vector<ProbeOutcome> openPorts;          ///< Open outcomes in completion order
    int closedCount{0};                           ///< Number of non-open outcomes

    /**
     * @brief Number of ports the scan produced an outcome for.
     * @return closedCount plus the number of open ports.
     */
    [[nodiscard]] std::size_t totalPorts() const {
        return static_cast<std::size_t>(closedCount) + openPorts.size();
    }

    bool operator==(const ScanReport& other) const = default;
};

/**
 * @brief Formats a time point as ISO-8601 UTC with millisecond precision.
 * @param tp Time point to format.
 * @return String of the form "2024-05-01T12:30:45.123Z".
 */
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

/**
 * @brief Parses a timestamp produced by formatTimestamp().
 *
 * The fractional part and the trailing 'Z' are optional.
 *
 * @param str Timestamp string.
 * @return The parsed time point, or nullopt if the string is malformed.
 */
std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& str);

} // namespace portprobe::core

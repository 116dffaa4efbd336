/**
 * @file IPortProber.hpp
 * @brief Interface for probing a single TCP port.
 */

#pragma once

#include "core/types/ScanReport.hpp"

#include <chrono>
#include <string>

namespace portprobe::core {

/**
 * @brief Probes one (host, port) pair with a bounded connect attempt.
 *
 * Implementations never throw for network conditions: refusal, timeout,
 * unreachable hosts and unresolvable names are all reported as
 * PortState::Closed. They must be safe to call from many threads at once.
 */
class IPortProber {
public:
    virtual ~IPortProber() = default;

    /**
     * @brief Attempts one TCP connection and classifies the result.
     * @param host Target IP address or hostname.
     * @param port Port to connect to.
     * @param timeout Limit on the connection-establishment phase.
     * @return Outcome for the port; service is set only for open catalogued ports.
     */
    virtual ProbeOutcome probe(const std::string& host, int port,
                               std::chrono::milliseconds timeout) = 0;
};

} // namespace portprobe::core

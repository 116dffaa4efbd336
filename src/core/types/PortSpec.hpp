/**
 * @file PortSpec.hpp
 * @brief Parsing of user port specifications into concrete port sequences.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace portprobe::core {

/**
 * @brief Kind of port specification given by the user.
 */
enum class PortSpecKind {
    Default, ///< Catalog ports (no specification given)
    List,    ///< Explicit comma-separated list, e.g. "22,80,443"
    Range    ///< Inclusive range, e.g. "1-1024"
};

/**
 * @brief A validated port specification.
 *
 * Ports are not checked against 1-65535. Out-of-range numbers are kept and
 * later reported as closed by the prober.
 */
struct PortSpec {
    PortSpecKind kind{PortSpecKind::Default}; ///< How the ports were specified
    std::vector<int> listPorts;               ///< Ports as written (List only)
    int rangeStart{0};                        ///< First port (Range only)
    int rangeEnd{0};                          ///< Last port, inclusive (Range only)

    /**
     * @brief Parses a port specification string.
     *
     * An absent or empty string selects the catalog ports. A string with a '-'
     * must be exactly "start-end" with start <= end. Anything else is a
     * comma-separated list; duplicates and order are kept as written.
     *
     * @param text Specification text, or nullopt for the default ports.
     * @return The parsed specification.
     * @throws InvalidPortSpec if the text is malformed.
     */
    static PortSpec parse(const std::optional<std::string>& text);

    /**
     * @brief Expands the specification into the ordered sequence of ports to probe.
     * @return Ports in probing order.
     */
    [[nodiscard]] std::vector<int> getPortsToScan() const;

    /**
     * @brief Parses and expands a specification in one step.
     * @param text Specification text, or nullopt for the default ports.
     * @return Ports in probing order.
     * @throws InvalidPortSpec if the text is malformed.
     */
    static std::vector<int> resolve(const std::optional<std::string>& text);
};

} // namespace portprobe::core

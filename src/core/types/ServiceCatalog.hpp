/**
 * @file ServiceCatalog.hpp
 * @brief Static table of well-known TCP ports and their service names.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace portprobe::core {

/**
 * @brief Read-only lookup of service names by port number.
 *
 * The table is built once on first use and never modified afterwards, so it
 * can be read from any number of threads without locking.
 */
class ServiceCatalog {
public:
    using Entry = std::pair<int, std::string>;

    /**
     * @brief Looks up the service usually found on a port.
     * @param port The port number to look up.
     * @return Service name if the port is catalogued, nullopt otherwise.
     */
    static std::optional<std::string> lookup(int port);

    /**
     * @brief Returns the catalogued ports in the catalog's fixed order.
     * @return Reference to the ordered port list.
     */
    static const std::vector<int>& ports();

    /**
     * @brief Returns all catalog entries in the catalog's fixed order.
     * @return Reference to the ordered (port, service) list.
     */
    static const std::vector<Entry>& entries();
};

} // namespace portprobe::core

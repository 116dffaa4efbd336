#include "core/types/ServiceCatalog.hpp"

#include <algorithm>

namespace portprobe::core {

const std::vector<ServiceCatalog::Entry>& ServiceCatalog::entries() {
    static const std::vector<Entry> services = {
        {21, "FTP"},     {22, "SSH"},    {23, "Telnet"},  {25, "SMTP"},
        {53, "DNS"},     {80, "HTTP"},   {110, "POP3"},   {143, "IMAP"},
        {443, "HTTPS"},  {445, "SMB"},   {993, "IMAPS"},  {995, "POP3S"},
        {3306, "MySQL"}, {3389, "RDP"},  {5432, "PostgreSQL"}, {8080, "HTTP-Proxy"}};
    return services;
}

const std::vector<int>& ServiceCatalog::ports() {
    static const std::vector<int> ports = [] {
        std::vector<int> keys;
        keys.reserve(entries().size());
        for (const auto& entry : entries()) {
            keys.push_back(entry.first);
        }
        return keys;
    }();
    return ports;
}

std::optional<std::string> ServiceCatalog::lookup(int port) {
    const auto& services = entries();
    auto it = std::find_if(services.begin(), services.end(),
                           [port](const Entry& entry) { return entry.first == port; });
    if (it == services.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace portprobe::core

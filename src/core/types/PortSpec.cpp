#include "core/types/PortSpec.hpp"

#include "core/Errors.hpp"
#include "core/types/ServiceCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace portprobe::core {

namespace {

std::string trim(const std::string& str) {
    auto first = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(str.rbegin(), str.rend(),
                                 [](unsigned char c) { return std::isspace(c); })
                    .base();
    return first < last ? std::string(first, last) : std::string();
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string::size_type start = 0;
    while (true) {
        auto pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            tokens.push_back(str.substr(start));
            break;
        }
        tokens.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return tokens;
}

int parsePortNumber(const std::string& spec, const std::string& token) {
    auto text = trim(token);
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        throw InvalidPortSpec("Invalid port specification '" + spec + "': '" + token +
                              "' is not a port number");
    }
    return value;
}

} // namespace

PortSpec PortSpec::parse(const std::optional<std::string>& text) {
    PortSpec spec;
    if (!text || trim(*text).empty()) {
        return spec;
    }

    const auto& str = *text;
    if (str.find('-') != std::string::npos) {
        auto tokens = split(str, '-');
        if (tokens.size() != 2) {
            throw InvalidPortSpec("Invalid port range '" + str + "': expected <start>-<end>");
        }
        spec.kind = PortSpecKind::Range;
        spec.rangeStart = parsePortNumber(str, tokens[0]);
        spec.rangeEnd = parsePortNumber(str, tokens[1]);
        if (spec.rangeStart > spec.rangeEnd) {
            throw InvalidPortSpec("Invalid port range '" + str + "': start " +
                                  std::to_string(spec.rangeStart) + " is greater than end " +
                                  std::to_string(spec.rangeEnd));
        }
        return spec;
    }

    spec.kind = PortSpecKind::List;
    for (const auto& token : split(str, ',')) {
        spec.listPorts.push_back(parsePortNumber(str, token));
    }
    return spec;
}

std::vector<int> PortSpec::getPortsToScan() const {
    switch (kind) {
    case PortSpecKind::Default:
        return ServiceCatalog::ports();
    case PortSpecKind::List:
        return listPorts;
    case PortSpecKind::Range: {
        std::vector<int> ports;
        ports.reserve(static_cast<std::size_t>(rangeEnd) - rangeStart + 1);
        for (int p = rangeStart;; ++p) {
            ports.push_back(p);
            if (p == rangeEnd) {
                break;
            }
        }
        return ports;
    }
    }
    return {};
}

std::vector<int> PortSpec::resolve(const std::optional<std::string>& text) {
    return parse(text).getPortsToScan();
}

} // namespace portprobe::core

#include "core/types/ScanReport.hpp"

#include <cstdio>
#include <ctime>

namespace portprobe::core {

std::string ProbeOutcome::stateToString() const {
    return portStateToString(state);
}

std::string ProbeOutcome::portStateToString(PortState state) {
    switch (state) {
    case PortState::Open:
        return "open";
    case PortState::Closed:
        return "closed";
    }
    return "closed";
}

std::optional<PortState> ProbeOutcome::stateFromString(const std::string& str) {
    if (str == "open")
        return PortState::Open;
    if (str == "closed")
        return PortState::Closed;
    return std::nullopt;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() %
        1000;
    if (millis < 0) {
        millis += 1000;
    }

    auto time = std::chrono::system_clock::to_time_t(std::chrono::floor<std::chrono::seconds>(tp));
    std::tm tm{};
    gmtime_r(&time, &tm);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);

    char result[40];
    std::snprintf(result, sizeof(result), "%s.%03dZ", buffer, static_cast<int>(millis));
    return result;
}

std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& str) {
    std::tm tm{};
    const char* rest = strptime(str.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
    if (rest == nullptr) {
        return std::nullopt;
    }

    int millis = 0;
    if (*rest == '.') {
        ++rest;
        int digits = 0;
        while (*rest >= '0' && *rest <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (*rest - '0');
            }
            ++digits;
            ++rest;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

    if (*rest == 'Z') {
        ++rest;
    }
    if (*rest != '\0') {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(timegm(&tm)) + std::chrono::milliseconds(millis);
}

} // namespace portprobe::core

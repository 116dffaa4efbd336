/**
 * @file Errors.hpp
 * @brief Exception types reported by PortProbe.
 *
 * Every failure that reaches the caller derives from PortProbeError. Per-port
 * connection failures are not errors; they are reported as closed ports.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace portprobe::core {

/**
 * @brief Base class for all PortProbe errors.
 */
class PortProbeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A port specification could not be parsed.
 *
 * Raised before any probing starts.
 */
class InvalidPortSpec : public PortProbeError {
public:
    using PortProbeError::PortProbeError;
};

/**
 * @brief A scanner setting is out of its valid range (e.g. concurrency <= 0).
 */
class InvalidConfiguration : public PortProbeError {
public:
    using PortProbeError::PortProbeError;
};

/**
 * @brief The serialized report could not be written.
 *
 * The in-memory report stays valid when this is thrown.
 */
class OutputWriteFailure : public PortProbeError {
public:
    using PortProbeError::PortProbeError;
};

/**
 * @brief A persisted report document is not a valid scan report.
 */
class ReportFormatError : public PortProbeError {
public:
    using PortProbeError::PortProbeError;
};

/**
 * @brief The command line could not be understood.
 */
class UsageError : public PortProbeError {
public:
    using PortProbeError::PortProbeError;
};

} // namespace portprobe::core

#pragma once

#include "core/services/IPortProber.hpp"

namespace portprobe::infra {

/**
 * @brief TCP connect prober built on Asio.
 *
 * Each call resolves the host, races an async_connect against a steady_timer
 * on a private io_context and closes the socket before returning. No data is
 * sent or received. Calls share no state and may run concurrently.
 */
class TcpPortProber : public core::IPortProber {
public:
    core::ProbeOutcome probe(const std::string& host, int port,
                             std::chrono::milliseconds timeout) override;
};

} // namespace portprobe::infra

#include "infrastructure/network/TcpPortProber.hpp"

#include "core/types/ServiceCatalog.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

namespace portprobe::infra {

core::ProbeOutcome TcpPortProber::probe(const std::string& host, int port,
                                        std::chrono::milliseconds timeout) {
    core::ProbeOutcome outcome;
    outcome.port = port;
    outcome.state = core::PortState::Closed;

    if (port < 1 || port > 65535) {
        spdlog::debug("Port {} is outside 1-65535, reporting closed", port);
        return outcome;
    }

    asio::io_context ioContext;
    asio::error_code ec;

    asio::ip::tcp::resolver resolver(ioContext);
    auto endpoints = resolver.resolve(host, std::to_string(port),
                                      asio::ip::resolver_base::numeric_service, ec);
    if (ec) {
        spdlog::debug("Could not resolve {}: {}", host, ec.message());
        return outcome;
    }

    asio::ip::tcp::socket socket(ioContext);
    asio::steady_timer timer(ioContext);
    bool connected = false;
    bool timedOut = false;

    asio::async_connect(socket, endpoints,
                        [&](const asio::error_code& connectEc, const asio::ip::tcp::endpoint&) {
                            timer.cancel();
                            if (!connectEc && !timedOut) {
                                connected = true;
                            } else {
                                ec = connectEc;
                            }
                        });

    timer.expires_after(timeout);
    timer.async_wait([&](const asio::error_code& timerEc) {
        if (timerEc || connected) {
            return; // Cancelled because the connect finished first
        }
        timedOut = true;
        asio::error_code ignored;
        socket.close(ignored);
    });

    ioContext.run();

    asio::error_code closeEc;
    socket.close(closeEc);

    if (connected) {
        outcome.state = core::PortState::Open;
        outcome.service = core::ServiceCatalog::lookup(port);
        spdlog::debug("{}:{} open", host, port);
    } else if (timedOut) {
        spdlog::trace("{}:{} timed out after {} ms", host, port, timeout.count());
    } else {
        spdlog::trace("{}:{} closed: {}", host, port, ec.message());
    }

    return outcome;
}

} // namespace portprobe::infra

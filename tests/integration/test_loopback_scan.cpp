#include <catch2/catch_test_macros.hpp>

#include "app/Application.hpp"
#include "core/Errors.hpp"
#include "core/types/PortSpec.hpp"
#include "infrastructure/export/ReportSerializer.hpp"
#include "infrastructure/network/PortScanner.hpp"
#include "infrastructure/network/TcpPortProber.hpp"

#include <asio.hpp>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace portprobe;

namespace {

const auto kLoopback = asio::ip::make_address("127.0.0.1");

int unusedLoopbackPort() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(kLoopback, 0));
    int port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

// Listening socket on loopback; connections complete in the kernel backlog.
class Listener {
public:
    explicit Listener(unsigned short port = 0) : acceptor_(io_) {
        asio::ip::tcp::endpoint endpoint(kLoopback, port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        asio::error_code ec;
        acceptor_.bind(endpoint, ec);
        if (!ec) {
            acceptor_.listen(asio::socket_base::max_listen_connections, ec);
        }
        bound_ = !ec;
    }

    bool bound() const { return bound_; }
    int port() const { return acceptor_.local_endpoint().port(); }

private:
    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    bool bound_{false};
};

// Redirects file descriptor 1 into a file until restore() or destruction.
class StdoutCapture {
public:
    explicit StdoutCapture(const std::filesystem::path& path) : path_(path) {
        std::fflush(stdout);
        saved_ = ::dup(STDOUT_FILENO);
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
        if (saved_ >= 0 && fd >= 0) {
            active_ = ::dup2(fd, STDOUT_FILENO) >= 0;
        }
        if (fd >= 0) {
            ::close(fd);
        }
    }

    ~StdoutCapture() { restore(); }

    bool active() const { return active_; }

    std::string restore() {
        if (saved_ >= 0) {
            std::fflush(stdout);
            ::dup2(saved_, STDOUT_FILENO);
            ::close(saved_);
            saved_ = -1;
        }
        std::ifstream file(path_);
        return std::string(std::istreambuf_iterator<char>(file), {});
    }

private:
    std::filesystem::path path_;
    int saved_{-1};
    bool active_{false};
};

} // namespace

TEST_CASE("Loopback scan with nothing listening", "[integration]") {
    infra::TcpPortProber prober;
    infra::PortScanner scanner(prober, std::chrono::milliseconds(1000));

    int port = unusedLoopbackPort();
    auto report = scanner.scan("127.0.0.1", {port}, 50);

    REQUIRE(report.host == "127.0.0.1");
    REQUIRE(report.openPorts.empty());
    REQUIRE(report.closedCount == 1);
}

TEST_CASE("Loopback scan finds listeners", "[integration]") {
    Listener first;
    Listener second;
    REQUIRE(first.bound());
    REQUIRE(second.bound());

    int closedA = unusedLoopbackPort();
    int closedB = unusedLoopbackPort();

    infra::TcpPortProber prober;
    infra::PortScanner scanner(prober, std::chrono::milliseconds(1000));

    std::vector<int> ports = {closedA, first.port(), closedB, second.port()};
    auto report = scanner.scan("127.0.0.1", ports, 4);

    REQUIRE(report.totalPorts() == ports.size());
    REQUIRE(report.openPorts.size() == 2);
    REQUIRE(report.closedCount == 2);
    for (const auto& outcome : report.openPorts) {
        REQUIRE(outcome.isOpen());
        REQUIRE((outcome.port == first.port() || outcome.port == second.port()));
        REQUIRE_FALSE(outcome.service.has_value());
    }
}

TEST_CASE("Loopback scan names the HTTP-Proxy port", "[integration]") {
    Listener proxy(8080);
    if (!proxy.bound()) {
        WARN("Port 8080 is in use on this machine; catalogued listener check not run");
        return;
    }

    infra::TcpPortProber prober;
    infra::PortScanner scanner(prober, std::chrono::milliseconds(1000));

    int closed = unusedLoopbackPort();
    auto ports = core::PortSpec::resolve("8080," + std::to_string(closed));
    auto report = scanner.scan("127.0.0.1", ports, 50);

    REQUIRE(report.openPorts.size() == 1);
    REQUIRE(report.openPorts[0].port == 8080);
    REQUIRE(report.openPorts[0].state == core::PortState::Open);
    REQUIRE(report.openPorts[0].service == "HTTP-Proxy");
    REQUIRE(report.closedCount == 1);
}

TEST_CASE("Application end to end", "[integration]") {
    auto dir = std::filesystem::temp_directory_path() / "portprobe_app_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    Listener listener;
    REQUIRE(listener.bound());
    int closed = unusedLoopbackPort();

    app::CommandLineOptions options;
    options.target = "127.0.0.1";
    options.ports = std::to_string(listener.port()) + "," + std::to_string(closed);
    options.threads = 2;
    options.timeoutMs = 1000;
    options.logLevel = "off";

    SECTION("Scan, print and save") {
        auto outputPath = dir / "report.json";
        options.outputPath = outputPath.string();

        std::ostringstream out;
        app::Application application(options, out);
        REQUIRE(application.run() == 0);

        auto text = out.str();
        REQUIRE(text.find("[*] Scanning 127.0.0.1...") != std::string::npos);
        REQUIRE(text.find("[*] Ports to scan: 2") != std::string::npos);
        REQUIRE(text.find("[+] Port " + std::to_string(listener.port()) + "/tcp OPEN - Unknown") !=
                std::string::npos);
        REQUIRE(text.find("Closed Ports: 1") != std::string::npos);
        REQUIRE(text.find("Results saved to") != std::string::npos);

        auto saved = infra::ReportSerializer::readFromFile(outputPath);
        REQUIRE(application.lastReport().has_value());
        REQUIRE(saved == *application.lastReport());
        REQUIRE(saved.openPorts.size() == 1);
        REQUIRE(saved.closedCount == 1);
    }

    SECTION("Malformed port specification fails before scanning") {
        options.ports = "22,foo";

        std::ostringstream out;
        app::Application application(options, out);
        REQUIRE_THROWS_AS(application.run(), core::InvalidPortSpec);
        REQUIRE_FALSE(application.lastReport().has_value());
        REQUIRE(out.str().empty());
    }

    SECTION("Reversed range fails before scanning") {
        options.ports = "50-20";

        std::ostringstream out;
        app::Application application(options, out);
        REQUIRE_THROWS_AS(application.run(), core::InvalidPortSpec);
        REQUIRE(out.str().empty());
    }

    SECTION("Non-positive worker count is rejected") {
        options.threads = 0;

        std::ostringstream out;
        app::Application application(options, out);
        REQUIRE_THROWS_AS(application.run(), core::InvalidConfiguration);
        REQUIRE(out.str().empty());
    }

    SECTION("Unwritable output keeps the in-memory report") {
        options.outputPath = (dir / "missing" / "report.json").string();

        std::ostringstream out;
        app::Application application(options, out);
        REQUIRE_THROWS_AS(application.run(), core::OutputWriteFailure);
        REQUIRE(application.lastReport().has_value());
        REQUIRE(application.lastReport()->totalPorts() == 2);
        REQUIRE(out.str().find("SCAN SUMMARY") != std::string::npos);
    }

    SECTION("Config file supplies defaults, flags override") {
        auto configPath = dir / "config.json";
        {
            std::ofstream file(configPath);
            file << R"({"scanner": {"concurrency": 7, "timeout_ms": 300},
                        "logging": {"level": "off"}})";
        }
        options.configPath = configPath.string();
        options.threads.reset();

        std::ostringstream out;
        app::Application application(options, out);
        REQUIRE(application.run() == 0);
        REQUIRE(application.config().scanner.concurrency == 7);
        REQUIRE(application.config().scanner.timeoutMs == 1000);
    }

    SECTION("Config loading problems are logged to stderr, not stdout") {
        auto configPath = dir / "broken.json";
        {
            std::ofstream file(configPath);
            file << "{ not json";
        }
        options.configPath = configPath.string();
        options.logLevel = "info";
        options.ports = std::to_string(closed);

        // A logger left on stdout from earlier would leak into the report.
        auto stdoutLogger = std::make_shared<spdlog::logger>(
            "stdout", std::make_shared<spdlog::sinks::stdout_sink_mt>());
        stdoutLogger->set_level(spdlog::level::trace);
        spdlog::set_default_logger(stdoutLogger);

        StdoutCapture capture(dir / "stdout.txt");
        if (!capture.active()) {
            WARN("Could not redirect stdout; log destination check not run");
            return;
        }

        std::ostringstream out;
        app::Application application(options, out);
        int code = application.run();
        spdlog::default_logger()->flush();
        auto captured = capture.restore();
        spdlog::set_level(spdlog::level::off);

        REQUIRE(code == 0);
        REQUIRE(captured.find("config") == std::string::npos);
        REQUIRE(captured.find("could not be loaded") == std::string::npos);
        REQUIRE(application.config().scanner.concurrency == 2);
    }

    std::filesystem::remove_all(dir);
}

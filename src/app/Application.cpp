#include "app/Application.hpp"

#include "app/ReportPrinter.hpp"
#include "core/Errors.hpp"
#include "core/types/PortSpec.hpp"
#include "infrastructure/export/ReportSerializer.hpp"
#include "infrastructure/network/PortScanner.hpp"
#include "infrastructure/network/TcpPortProber.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace portprobe::app {

Application::Application(CommandLineOptions options, std::ostream& out)
    : options_(std::move(options)), out_(out) {}

void Application::loadConfiguration() {
    if (options_.configPath) {
        infra::ConfigManager manager(*options_.configPath);
        if (!manager.load()) {
            spdlog::warn("Using default settings, {} could not be loaded", *options_.configPath);
        }
        config_ = manager.config();
    }

    if (options_.threads) {
        config_.scanner.concurrency = *options_.threads;
    }
    if (options_.timeoutMs) {
        config_.scanner.timeoutMs = *options_.timeoutMs;
    }
    if (options_.logLevel) {
        config_.logging.level = *options_.logLevel;
    }
    if (options_.logFile) {
        config_.logging.file = *options_.logFile;
    }
}

void Application::initializeLogging(const std::string& levelName, const std::string& logFile) {
    auto level = spdlog::level::from_str(levelName);
    if (level == spdlog::level::off && levelName != "off") {
        throw core::InvalidConfiguration("Unknown log level '" + levelName + "'");
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(level);
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, 5 * 1024 * 1024, 3);
            fileSink->set_level(spdlog::level::debug);
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& e) {
            throw core::InvalidConfiguration("Cannot open log file '" + logFile + "': " +
                                             e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("portprobe", sinks.begin(), sinks.end());
    // The file sink records debug output even when the console is quieter.
    logger->set_level(logFile.empty() ? level : std::min(level, spdlog::level::debug));
    spdlog::set_default_logger(logger);

    spdlog::debug("PortProbe logging at level {}", levelName);
}

int Application::run() {
    // Config loading logs too, so stderr logging must be in place before it.
    initializeLogging(options_.logLevel.value_or(config_.logging.level), "");
    loadConfiguration();
    initializeLogging(config_.logging.level, config_.logging.file);

    config_.scanner.validate();
    auto ports = core::PortSpec::resolve(options_.ports);

    infra::TcpPortProber prober;
    infra::PortScanner scanner(prober, config_.scanner.timeout());
    ReportPrinter printer(out_);

    printer.printScanStart(options_.target, ports.size());

    auto report = scanner.scan(
        options_.target, ports, config_.scanner.concurrency,
        [&printer](const core::ProbeOutcome& outcome) { printer.printOpenPort(outcome); },
        [](const core::ScanProgress& progress) {
            spdlog::trace("Progress: {}/{} ports, {} open", progress.scannedPorts,
                          progress.totalPorts, progress.openPorts);
        });
    lastReport_ = report;

    printer.printSummary(report);

    if (options_.outputPath) {
        infra::ReportSerializer::writeToFile(report, *options_.outputPath, config_.jsonIndent);
        printer.printSaved(*options_.outputPath);
    }

    return 0;
}

} // namespace portprobe::app

#include "app/Application.hpp"
#include "app/CommandLine.hpp"
#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <utility>

int main(int argc, char* argv[]) {
    portprobe::app::CommandLineOptions options;
    try {
        options = portprobe::app::parseCommandLine(argc, argv);
    } catch (const portprobe::core::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        portprobe::app::printUsage(std::cerr, argv[0]);
        return 1;
    }

    if (options.showHelp) {
        portprobe::app::printUsage(std::cout, argv[0]);
        return 0;
    }

    try {
        portprobe::app::Application app(std::move(options), std::cout);
        return app.run();
    } catch (const portprobe::core::PortProbeError& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}

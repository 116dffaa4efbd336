#include "app/CommandLine.hpp"

#include "core/Errors.hpp"

#include <getopt.h>

#include <charconv>
#include <cstring>

namespace portprobe::app {

namespace {

enum LongOnlyOption : int {
    kThreads = 1000,
    kTimeout,
    kConfig,
    kLogLevel,
    kLogFile,
};

int parseInteger(const char* optionName, const char* value) {
    int result = 0;
    const char* end = value + std::strlen(value);
    auto [ptr, ec] = std::from_chars(value, end, result);
    if (ec != std::errc{} || ptr != end || ptr == value) {
        throw core::UsageError(std::string("Option --") + optionName +
                               " expects an integer, got '" + value + "'");
    }
    return result;
}

} // namespace

CommandLineOptions parseCommandLine(int argc, char* argv[]) {
    static const struct option longOptions[] = {
        {"target", required_argument, nullptr, 't'},
        {"ports", required_argument, nullptr, 'p'},
        {"output", required_argument, nullptr, 'o'},
        {"threads", required_argument, nullptr, kThreads},
        {"timeout", required_argument, nullptr, kTimeout},
        {"config", required_argument, nullptr, kConfig},
        {"log-level", required_argument, nullptr, kLogLevel},
        {"log-file", required_argument, nullptr, kLogFile},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}};

    CommandLineOptions options;

    // Full getopt reset so the parser can run more than once per process.
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":t:p:o:h", longOptions, nullptr)) != -1) {
        switch (opt) {
        case 't':
            options.target = optarg;
            break;
        case 'p':
            options.ports = optarg;
            break;
        case 'o':
            options.outputPath = optarg;
            break;
        case kThreads:
            options.threads = parseInteger("threads", optarg);
            break;
        case kTimeout:
            options.timeoutMs = parseInteger("timeout", optarg);
            break;
        case kConfig:
            options.configPath = optarg;
            break;
        case kLogLevel:
            options.logLevel = optarg;
            break;
        case kLogFile:
            options.logFile = optarg;
            break;
        case 'h':
            options.showHelp = true;
            break;
        case ':':
            throw core::UsageError(std::string("Option ") + argv[optind - 1] +
                                   " requires a value");
        default:
            if (optopt != 0) {
                throw core::UsageError(std::string("Unknown option -") +
                                       static_cast<char>(optopt));
            }
            throw core::UsageError(std::string("Unknown option ") + argv[optind - 1]);
        }
    }

    if (optind < argc) {
        throw core::UsageError(std::string("Unexpected argument '") + argv[optind] + "'");
    }

    if (!options.showHelp && options.target.empty()) {
        throw core::UsageError("No target specified (use -t <host>)");
    }

    return options;
}

void printUsage(std::ostream& out, const std::string& programName) {
    out << "Usage: " << programName << " -t <host> [options]\n"
        << "\n"
        << "Discover open TCP ports on a host with a connect scan.\n"
        << "\n"
        << "Options:\n"
        << "  -t, --target <host>    Target IP address or hostname (required)\n"
        << "  -p, --ports <spec>     Ports to scan, e.g. 22,80,443 or 1-1000\n"
        << "                         (default: 16 common service ports)\n"
        << "  -o, --output <file>    Save the report as JSON\n"
        << "      --threads <n>      Number of concurrent probes (default: 50)\n"
        << "      --timeout <ms>     Connect timeout per port (default: 1000)\n"
        << "      --config <file>    Load settings from a JSON config file\n"
        << "      --log-level <lvl>  trace, debug, info, warn, error, critical, off\n"
        << "      --log-file <file>  Also write logs to a rotating file\n"
        << "  -h, --help             Show this help\n";
}

} // namespace portprobe::app

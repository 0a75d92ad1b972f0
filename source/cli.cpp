#include "tabsync/cli.hpp"
#include "tabsync/util.hpp"
#include <getopt.h>

namespace tabsync {

namespace {

enum LongOnly { OPT_NO_INTEGRITY = 1000, OPT_LOG_FILE };

bool parseCount(const char* name, const char* arg, int minValue, int& out, std::string& err) {
    if (!util::parseInt(arg ? arg : "", out) || out < minValue) {
        err = std::string("invalid value for ") + name + ": '" + (arg ? arg : "") + "' (expected an integer >= " +
              std::to_string(minValue) + ")";
        return false;
    }
    return true;
}

} // namespace

std::string usageText(const std::string& argv0) {
    return "Usage: " + argv0 + " [OPTIONS]\n"
           "\n"
           "Download the files listed in a dataset manifest with aria2c and verify them.\n"
           "\n"
           "Options:\n"
           "  -c, --config FILE                 Config file (default: tabsync.env or tabsync.json)\n"
           "  -d, --download-dir DIR            Override download directory\n"
           "  -m, --manifest-url URL            Override manifest URL\n"
           "  -j, --concurrency N               Concurrent downloads\n"
           "  -r, --run-integrity               Check existing files before downloading\n"
           "  -i, --integrity-retries N         Transfer-and-verify cycles for failing files\n"
           "  -w, --concurrent-validations N    Parallel validations (0 = CPU count)\n"
           "      --no-integrity                Skip validation after transfers\n"
           "  -n, --dry-run                     Plan only, do not download\n"
           "  -v, --verbose                     Debug output\n"
           "  -q, --quiet                       Warnings and errors only\n"
           "      --log-file FILE               Also log to FILE (always debug level)\n"
           "  -V, --version                     Print version\n"
           "  -h, --help                        Show this help\n";
}

CliAction parseCommandLine(int argc, char** argv, CliOptions& out, std::string& err) {
    static struct option longOpts[] = {{"config", required_argument, nullptr, 'c'},
                                       {"download-dir", required_argument, nullptr, 'd'},
                                       {"manifest-url", required_argument, nullptr, 'm'},
                                       {"concurrency", required_argument, nullptr, 'j'},
                                       {"run-integrity", no_argument, nullptr, 'r'},
                                       {"integrity-retries", required_argument, nullptr, 'i'},
                                       {"concurrent-validations", required_argument, nullptr, 'w'},
                                       {"no-integrity", no_argument, nullptr, OPT_NO_INTEGRITY},
                                       {"dry-run", no_argument, nullptr, 'n'},
                                       {"verbose", no_argument, nullptr, 'v'},
                                       {"quiet", no_argument, nullptr, 'q'},
                                       {"log-file", required_argument, nullptr, OPT_LOG_FILE},
                                       {"version", no_argument, nullptr, 'V'},
                                       {"help", no_argument, nullptr, 'h'},
                                       {nullptr, 0, nullptr, 0}};

    out = CliOptions{};
    bool verbose = false;
    bool quiet = false;
    // Full re-initialisation so the parser can be run more than once.
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":c:d:m:j:ri:w:nvqVh", longOpts, nullptr)) != -1) {
        int value = 0;
        switch (opt) {
        case 'c':
            out.configPath = optarg;
            break;
        case 'd':
            out.overrides.downloadDir = std::string(optarg);
            break;
        case 'm':
            out.overrides.manifestUrl = std::string(optarg);
            break;
        case 'j':
            if (!parseCount("--concurrency", optarg, 1, value, err)) return CliAction::Error;
            out.overrides.concurrentDownloads = value;
            break;
        case 'r':
            out.runIntegrity = true;
            break;
        case 'i':
            if (!parseCount("--integrity-retries", optarg, 1, value, err)) return CliAction::Error;
            out.overrides.integrityRetryCount = value;
            break;
        case 'w':
            if (!parseCount("--concurrent-validations", optarg, 0, value, err)) return CliAction::Error;
            out.overrides.concurrentValidations = value;
            break;
        case OPT_NO_INTEGRITY:
            out.overrides.integrityCheck = false;
            break;
        case 'n':
            out.dryRun = true;
            break;
        case 'v':
            verbose = true;
            break;
        case 'q':
            quiet = true;
            break;
        case OPT_LOG_FILE:
            out.overrides.logFile = std::string(optarg);
            break;
        case 'V':
            return CliAction::Version;
        case 'h':
            return CliAction::Help;
        case ':':
            err = "option requires an argument: " + std::string(argv[optind - 1]);
            return CliAction::Error;
        default:
            err = "unknown option: " + std::string(argv[optind - 1]);
            return CliAction::Error;
        }
    }

    if (optind < argc) {
        err = "unexpected argument: " + std::string(argv[optind]);
        return CliAction::Error;
    }
    if (verbose && quiet) {
        err = "--verbose and --quiet are mutually exclusive";
        return CliAction::Error;
    }
    if (verbose) out.consoleLevel = LogLevel::Debug;
    if (quiet) out.consoleLevel = LogLevel::Warn;
    out.verbosityGiven = verbose || quiet;
    return CliAction::Run;
}

} // namespace tabsync

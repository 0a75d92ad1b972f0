#pragma once

#include <string>

#include "tabsync/config.hpp"
#include "tabsync/logger.hpp"

namespace tabsync {

struct CliOptions {
    std::string configPath;
    ConfigOverrides overrides;
    bool runIntegrity{false};
    bool dryRun{false};
    // Debug with -v, Warn with -q.
    LogLevel consoleLevel{LogLevel::Info};
    bool verbosityGiven{false};
};

enum class CliAction { Run, Help, Version, Error };

// Parse argv. Error sets err; nothing is printed.
CliAction parseCommandLine(int argc, char** argv, CliOptions& out, std::string& err);

std::string usageText(const std::string& argv0);

} // namespace tabsync

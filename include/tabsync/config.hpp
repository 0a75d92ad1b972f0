#pragma once

#include <optional>
#include <string>

namespace tabsync {

struct Config {
    // Manifest location: http://, https://, file:// or a local path.
    std::string manifestUrl{"https://export.sourcify.dev/manifest.json"};
    // Destination directory; absolute after finalizeConfig().
    std::string downloadDir{"./downloads"};
    // Bulk transfer executable (aria2c compatible).
    std::string aria2cPath{"aria2c"};
    // Simultaneous downloads handed to the transfer tool (-j).
    int concurrentDownloads{5};
    // Validate transferred Parquet files after each transfer cycle.
    bool integrityCheck{true};
    // Transfer-then-verify cycles allowed before failures become permanent.
    int integrityRetryCount{3};
    // Validation workers; 0 picks the hardware concurrency.
    int concurrentValidations{0};
    // Passed through as --file-allocation.
    std::string fileAllocation{"falloc"};
    // Timeout for manifest requests over plain HTTP.
    int httpTimeoutSeconds{30};
    // Logging verbosity (debug, info, warn, error)
    std::string logLevel{"info"};
    // Optional log file, always written at debug level.
    std::string logFile;

    // Prefix joined with each manifest path. When empty, finalizeConfig() derives
    // it from manifestUrl (up to and including the last '/').
    std::string baseUrl;

    // aria2c session file used for crash recovery.
    std::string sessionFile() const;
};

// Command-line values that take precedence over the config file.
struct ConfigOverrides {
    std::optional<std::string> downloadDir;
    std::optional<std::string> manifestUrl;
    std::optional<int> concurrentDownloads;
    std::optional<int> integrityRetryCount;
    std::optional<int> concurrentValidations;
    std::optional<bool> integrityCheck;
    std::optional<std::string> logFile;
};

// Load defaults, then the config file, then overrides, and validate.
// An empty path tries tabsync.env and tabsync.json in the working directory;
// neither existing is fine. An explicit path that is missing is an error.
bool loadConfig(const std::string& path, const ConfigOverrides& overrides, Config& outCfg, std::string& outError);

// Parse .env-style or JSON content into outCfg (no validation).
bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError);
bool parseJsonString(const std::string& contents, Config& outCfg, std::string& outError);

void applyOverrides(const ConfigOverrides& overrides, Config& cfg);

// Validate ranges, expand download_dir and derive baseUrl.
bool finalizeConfig(Config& cfg, std::string& outError);

// "https://host/a/b/manifest.json" -> "https://host/a/b/".
std::string deriveBaseUrl(const std::string& manifestUrl);

// "~/x" -> "$HOME/x", relative -> absolute; lexically normalized.
std::string expandPath(const std::string& path);

} // namespace tabsync

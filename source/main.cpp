#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "tabsync/cli.hpp"
#include "tabsync/config.hpp"
#include "tabsync/integrity.hpp"
#include "tabsync/logger.hpp"
#include "tabsync/manifest.hpp"
#include "tabsync/sync.hpp"
#include "tabsync/transfer.hpp"
#include "tabsync/version.hpp"

using tabsync::Config;
using tabsync::SyncEvent;
using tabsync::SyncEventKind;

namespace {

constexpr int kBarWidth = 40;

std::string progressBar(const char* label, size_t completed, size_t total) {
    size_t filled = total == 0 ? kBarWidth : (kBarWidth * completed) / total;
    if (filled > static_cast<size_t>(kBarWidth)) filled = kBarWidth;
    return std::string(label) + ": [" + std::string(filled, '#') + std::string(kBarWidth - filled, '.') + "] " +
           std::to_string(completed) + "/" + std::to_string(total);
}

// Renders engine events on the console. Validation events arrive from worker threads.
class ConsoleObserver : public tabsync::SyncObserver {
public:
    void onEvent(const SyncEvent& ev) override {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (ev.kind) {
        case SyncEventKind::PlanProgress:
            tabsync::writeProgress(progressBar("Checking", ev.completed, ev.total));
            break;
        case SyncEventKind::PlanComputed:
            tabsync::endProgress();
            tabsync::logInfo("Found " + std::to_string(ev.count) + " file(s) to download, " +
                             std::to_string(ev.completed) + " already complete");
            break;
        case SyncEventKind::TransferCycleStarted:
            if (ev.cycle > 1) tabsync::logInfo("Re-downloading " + std::to_string(ev.count) + " file(s)...");
            else tabsync::logInfo("Starting download...");
            break;
        case SyncEventKind::ValidationStarted:
            lastValidated_ = 0;
            tabsync::logDebug(ev.cycle == 0 ? "Checking existing files..." : "Verifying parquet file integrity...");
            break;
        case SyncEventKind::ValidationProgress:
            // Workers finish in any order; never move the bar backwards.
            if (ev.completed <= lastValidated_) break;
            lastValidated_ = ev.completed;
            tabsync::writeProgress(progressBar("Integrity", ev.completed, ev.total));
            break;
        case SyncEventKind::CycleFinished:
            tabsync::endProgress();
            if (ev.exitCode != 0) break;
            if (ev.failed > 0) tabsync::logWarn("Found " + std::to_string(ev.failed) + " corrupt file(s)");
            else tabsync::logInfo("All files passed integrity check");
            break;
        }
    }

private:
    std::mutex mutex_;
    size_t lastValidated_{0};
};

void printConfig(const Config& cfg, const tabsync::CliOptions& opts) {
    tabsync::logInfo("Manifest URL: " + cfg.manifestUrl);
    tabsync::logInfo("Download directory: " + cfg.downloadDir);
    tabsync::logInfo("Concurrent downloads: " + std::to_string(cfg.concurrentDownloads));
    tabsync::logInfo(std::string("Integrity check: ") + (cfg.integrityCheck ? "enabled" : "disabled"));
    tabsync::logInfo("Integrity retries: " + std::to_string(cfg.integrityRetryCount));
    tabsync::logInfo("Concurrent validations: " +
                     (cfg.concurrentValidations > 0 ? std::to_string(cfg.concurrentValidations) : std::string("auto")));
    if (opts.runIntegrity) tabsync::logInfo("Pre-download integrity check: enabled");
    if (opts.dryRun) tabsync::logInfo("Dry run: nothing will be downloaded");
    tabsync::logDebug("Base URL: " + cfg.baseUrl, "CFG");
    tabsync::logDebug("Session file: " + cfg.sessionFile(), "CFG");
}

void printSummary(const tabsync::DownloadResult& result) {
    const std::string rule(50, '=');
    tabsync::logInfo("");
    tabsync::logInfo(rule);
    tabsync::logInfo("Download Summary");
    tabsync::logInfo(rule);
    tabsync::logInfo("Total files in manifest: " + std::to_string(result.totalFiles));
    tabsync::logInfo("Already complete: " + std::to_string(result.skippedFiles));
    if (result.outcome == tabsync::SyncOutcome::DryRun) {
        tabsync::logInfo("Would download: " + std::to_string(result.plannedFiles));
    } else {
        tabsync::logInfo("Downloaded/resumed: " + std::to_string(result.attemptedFiles));
    }
    if (result.sessionResumed > 0) {
        tabsync::logInfo("Resumed from previous session: " + std::to_string(result.sessionResumed));
    }
    if (result.preCheckFailures > 0) {
        tabsync::logInfo("Corrupt files found before download: " + std::to_string(result.preCheckFailures));
    }
    if (result.integrityRetries > 0) {
        tabsync::logInfo("Integrity retries: " + std::to_string(result.integrityRetries));
    }
    if (result.nameCollisions > 0) {
        tabsync::logWarn("File name collisions: " + std::to_string(result.nameCollisions));
    }
    if (result.blockedPaths > 0) {
        tabsync::logWarn("Paths blocked by directories: " + std::to_string(result.blockedPaths));
    }
    if (result.integrityFailures > 0) {
        tabsync::logWarn("Integrity failures: " + std::to_string(result.integrityFailures));
        for (const auto& name : result.failedFiles) tabsync::logWarn("  " + name);
        tabsync::logWarn("Some files failed integrity checks after max retries.");
    }
    tabsync::logDebug(std::string("Outcome: ") + tabsync::syncOutcomeLabel(result.outcome), "SYNC");

    if (result.exitCode != 0) {
        tabsync::logWarn("aria2c exit code: " + std::to_string(result.exitCode));
        tabsync::logInfo("Note: Session saved. Run again to resume incomplete downloads.");
    } else if (result.integrityFailures > 0 || result.blockedPaths > 0) {
        tabsync::logWarn("Sync completed with errors.");
    } else if (result.outcome != tabsync::SyncOutcome::DryRun) {
        tabsync::logInfo("All files synced successfully!");
    }
}

} // namespace

int main(int argc, char** argv) {
    tabsync::CliOptions opts;
    std::string err;
    switch (tabsync::parseCommandLine(argc, argv, opts, err)) {
    case tabsync::CliAction::Help:
        std::cout << tabsync::usageText(argv[0]);
        return 0;
    case tabsync::CliAction::Version:
        std::cout << "tabsync " << tabsync::appVersion() << "\n";
        return 0;
    case tabsync::CliAction::Error:
        std::cerr << "tabsync: " << err << "\n\n" << tabsync::usageText(argv[0]);
        return 2;
    case tabsync::CliAction::Run:
        break;
    }

    tabsync::setLogLevel(opts.consoleLevel);
    Config cfg;
    if (!tabsync::loadConfig(opts.configPath, opts.overrides, cfg, err)) {
        tabsync::logError(err, "CFG");
        return 1;
    }
    if (!opts.verbosityGiven) tabsync::setLogLevelFromString(cfg.logLevel);
    if (!cfg.logFile.empty() && !tabsync::openLogFile(cfg.logFile)) {
        tabsync::logWarn("Cannot open log file " + cfg.logFile + "; continuing without it", "CFG");
    }
    tabsync::logDebug(std::string("tabsync ") + tabsync::appVersion() + " starting", "APP");
    printConfig(cfg, opts);

    std::string body;
    if (!tabsync::fetchManifest(cfg, body, err)) {
        tabsync::logError("Error fetching manifest: " + tabsync::describeError(tabsync::classifyError(err)), "MAN");
        tabsync::closeLogFile();
        return 1;
    }
    std::vector<std::string> paths;
    size_t rejected = 0;
    if (!tabsync::extractFilePaths(body, paths, rejected, err)) {
        tabsync::logError("Error reading manifest: " + err, "MAN");
        tabsync::closeLogFile();
        return 1;
    }
    tabsync::logInfo("Found " + std::to_string(paths.size()) + " files in manifest");
    if (rejected > 0) tabsync::logWarn(std::to_string(rejected) + " unsafe manifest path(s) ignored", "MAN");

    tabsync::SyncOptions syncOpts = tabsync::syncOptionsFromConfig(cfg);
    syncOpts.runIntegrity = opts.runIntegrity;
    syncOpts.dryRun = opts.dryRun;

    tabsync::Aria2Runner runner(cfg);
    tabsync::ParquetValidator validator;
    ConsoleObserver observer;
    tabsync::DownloadResult result = tabsync::syncFiles(cfg, paths, syncOpts, runner, validator, &observer);

    printSummary(result);
    tabsync::closeLogFile();
    return tabsync::exitCodeFor(result);
}

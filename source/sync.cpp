#include "tabsync/sync.hpp"
#include "tabsync/filesystem.hpp"
#include "tabsync/logger.hpp"
#include "tabsync/planner.hpp"
#include "tabsync/session.hpp"
#include "tabsync/util.hpp"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace tabsync {

const char* syncOutcomeLabel(SyncOutcome outcome) {
    switch (outcome) {
        case SyncOutcome::NothingToDo: return "NothingToDo";
        case SyncOutcome::DryRun: return "DryRun";
        case SyncOutcome::Converged: return "Converged";
        case SyncOutcome::RetryBudgetExhausted: return "RetryBudgetExhausted";
        case SyncOutcome::TransferFailed: return "TransferFailed";
    }
    return "Unknown";
}

SyncOptions syncOptionsFromConfig(const Config& cfg) {
    SyncOptions opts;
    opts.integrityCheck = cfg.integrityCheck;
    opts.maxIntegrityRetries = cfg.integrityRetryCount;
    opts.maxValidationWorkers = cfg.concurrentValidations;
    return opts;
}

namespace {

// Existing files named by the manifest, validated before planning so that
// corrupt ones get scheduled again.
size_t preCheckExisting(const Config& cfg,
                        const std::vector<std::string>& paths,
                        const SyncOptions& options,
                        const FileValidator& validator,
                        SyncObserver* observer) {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    for (const auto& p : paths) {
        std::string name = util::lastPathSegment(p);
        if (!seen.insert(name).second) continue;
        if (isRegularFile(joinPath(cfg.downloadDir, name))) names.push_back(name);
    }
    if (names.empty()) return 0;

    logInfo("Checking " + std::to_string(names.size()) + " existing file(s)", "SYNC");
    SyncEvent ev;
    ev.kind = SyncEventKind::ValidationStarted;
    ev.cycle = 0;
    ev.total = names.size();
    notify(observer, ev);

    auto failed = verifyFiles(cfg.downloadDir, names, options.maxValidationWorkers, validator, observer, 0);
    if (!failed.empty()) {
        logWarn(std::to_string(failed.size()) + " existing file(s) failed validation", "SYNC");
    }
    return failed.size();
}

void runCycles(const Config& cfg,
               const std::vector<DownloadTask>& planned,
               const SyncOptions& options,
               TransferRunner& runner,
               const FileValidator& validator,
               SyncObserver* observer,
               DownloadResult& result) {
    int maxRetries = options.maxIntegrityRetries;
    if (maxRetries < 1) {
        logWarn("Retry budget " + std::to_string(maxRetries) + " is below 1; using 1", "SYNC");
        maxRetries = 1;
    }

    std::unordered_map<std::string, std::string> urlByName;
    for (const auto& t : planned) urlByName[t.fileName] = t.url;

    std::vector<DownloadTask> current = planned;
    for (int cycle = 1;; ++cycle) {
        SyncEvent started;
        started.kind = SyncEventKind::TransferCycleStarted;
        started.cycle = cycle;
        started.count = current.size();
        notify(observer, started);
        logInfo("Transfer cycle " + std::to_string(cycle) + ": " + std::to_string(current.size()) + " file(s)",
                "SYNC");

        result.exitCode = runner.run(current);

        SyncEvent finished;
        finished.kind = SyncEventKind::CycleFinished;
        finished.cycle = cycle;
        finished.exitCode = result.exitCode;

        if (result.exitCode != 0) {
            notify(observer, finished);
            logWarn("Transfer exited with code " + std::to_string(result.exitCode) + "; stopping", "SYNC");
            result.outcome = SyncOutcome::TransferFailed;
            return;
        }
        if (!options.integrityCheck) {
            notify(observer, finished);
            result.outcome = SyncOutcome::Converged;
            return;
        }

        std::vector<std::string> names;
        names.reserve(current.size());
        for (const auto& t : current) names.push_back(t.fileName);

        SyncEvent validating;
        validating.kind = SyncEventKind::ValidationStarted;
        validating.cycle = cycle;
        validating.total = names.size();
        notify(observer, validating);

        std::vector<std::string> failed =
            verifyFiles(cfg.downloadDir, names, options.maxValidationWorkers, validator, observer, cycle);
        finished.failed = failed.size();
        notify(observer, finished);

        if (failed.empty()) {
            result.outcome = SyncOutcome::Converged;
            return;
        }

        ++result.integrityRetries;
        if (result.integrityRetries >= maxRetries) {
            std::sort(failed.begin(), failed.end());
            logError(std::to_string(failed.size()) + " file(s) still failing after " +
                         std::to_string(result.integrityRetries) + " cycle(s)",
                     "SYNC");
            result.integrityFailures = failed.size();
            result.failedFiles = failed;
            result.outcome = SyncOutcome::RetryBudgetExhausted;
            return;
        }

        logWarn(std::to_string(failed.size()) + " file(s) failed validation; retrying", "SYNC");
        current.clear();
        for (const auto& name : failed) {
            auto it = urlByName.find(name);
            if (it != urlByName.end()) current.push_back(DownloadTask{it->second, name});
        }
    }
}

DownloadResult runSync(const Config& cfg,
                       const std::vector<std::string>& paths,
                       const SyncOptions& options,
                       TransferRunner& runner,
                       const FileValidator& validator,
                       SyncObserver* observer) {
    DownloadResult result;
    result.totalFiles = paths.size();

    if (options.runIntegrity) {
        result.preCheckFailures = preCheckExisting(cfg, paths, options, validator, observer);
    }

    PlanResult plan = planDownloads(paths, cfg.baseUrl, cfg.downloadDir, observer);
    result.blockedPaths = plan.blocked.size();
    std::vector<std::string> sessionCollisions;
    result.sessionResumed = mergePendingUrls(plan.tasks, loadPendingUrls(cfg.sessionFile()), &sessionCollisions);
    result.nameCollisions = plan.collisions.size() + sessionCollisions.size();

    // Skipped means complete on disk and not scheduled again by name.
    std::unordered_set<std::string> scheduledNames;
    for (const auto& t : plan.tasks) scheduledNames.insert(t.fileName);
    for (const auto& p : paths) {
        const std::string name = util::lastPathSegment(p);
        if (plan.sizeCache.count(name) && scheduledNames.count(name) == 0) ++result.skippedFiles;
    }
    result.plannedFiles = plan.tasks.size();

    SyncEvent computed;
    computed.kind = SyncEventKind::PlanComputed;
    computed.total = paths.size();
    computed.count = plan.tasks.size();
    computed.completed = result.skippedFiles;
    notify(observer, computed);

    if (plan.tasks.empty()) {
        logInfo("All files are up to date", "SYNC");
        removeSessionFile(cfg.sessionFile());
        result.outcome = SyncOutcome::NothingToDo;
        return result;
    }
    if (options.dryRun) {
        logInfo("Dry run: " + std::to_string(plan.tasks.size()) + " file(s) would be downloaded", "SYNC");
        result.outcome = SyncOutcome::DryRun;
        return result;
    }

    result.attemptedFiles = plan.tasks.size();
    runCycles(cfg, plan.tasks, options, runner, validator, observer, result);

    if (result.exitCode == 0) removeSessionFile(cfg.sessionFile());
    return result;
}

} // namespace

DownloadResult syncFiles(const Config& cfg,
                         const std::vector<std::string>& paths,
                         const SyncOptions& options,
                         TransferRunner& runner,
                         const FileValidator& validator,
                         SyncObserver* observer) {
    try {
        return runSync(cfg, paths, options, runner, validator, observer);
    } catch (const std::exception& e) {
        ErrorInfo info = classifyError(e.what(), ErrorCategory::Internal);
        logError(std::string("Sync aborted: ") + describeError(info), "SYNC");
        DownloadResult result;
        result.totalFiles = paths.size();
        result.exitCode = 1;
        result.outcome = SyncOutcome::TransferFailed;
        return result;
    }
}

int exitCodeFor(const DownloadResult& result) {
    if (result.exitCode != 0) return result.exitCode;
    if (result.integrityFailures > 0 || result.blockedPaths > 0) return 1;
    return 0;
}

} // namespace tabsync

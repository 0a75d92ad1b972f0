#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tabsync {

// One scheduled transfer: absolute source URL and the file name it is saved under.
struct DownloadTask {
    std::string url;
    std::string fileName;

    bool operator==(const DownloadTask& other) const {
        return url == other.url && fileName == other.fileName;
    }
};

enum class SyncOutcome {
    NothingToDo,          // every manifest file already complete
    DryRun,               // planned only
    Converged,            // last transfer succeeded and nothing failed verification
    RetryBudgetExhausted, // files still failing after the last allowed cycle
    TransferFailed        // transfer tool exited non-zero
};

const char* syncOutcomeLabel(SyncOutcome outcome);

// Statistics for one sync run. Only the orchestrator writes to it.
struct DownloadResult {
    size_t totalFiles{0};
    size_t skippedFiles{0};
    size_t attemptedFiles{0};
    int exitCode{0};
    size_t integrityFailures{0};
    int integrityRetries{0};

    size_t plannedFiles{0};
    size_t sessionResumed{0};
    size_t blockedPaths{0};
    size_t nameCollisions{0};
    size_t preCheckFailures{0};
    std::vector<std::string> failedFiles;
    SyncOutcome outcome{SyncOutcome::NothingToDo};
};

} // namespace tabsync

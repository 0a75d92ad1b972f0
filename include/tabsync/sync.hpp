#pragma once

#include <string>
#include <vector>

#include "tabsync/config.hpp"
#include "tabsync/events.hpp"
#include "tabsync/integrity.hpp"
#include "tabsync/models.hpp"
#include "tabsync/transfer.hpp"

namespace tabsync {

struct SyncOptions {
    // Validate files after each transfer cycle.
    bool integrityCheck{true};
    // Validate manifest files already on disk before planning.
    bool runIntegrity{false};
    // Plan only.
    bool dryRun{false};
    // Transfer-then-verify cycles allowed; values below 1 are treated as 1.
    int maxIntegrityRetries{3};
    int maxValidationWorkers{0};
};

SyncOptions syncOptionsFromConfig(const Config& cfg);

// Bring cfg.downloadDir in line with the manifest paths: plan, resume the
// previous session, transfer and verify until the files validate or the retry
// budget runs out. Never throws; every failure is reported in the result.
DownloadResult syncFiles(const Config& cfg,
                         const std::vector<std::string>& paths,
                         const SyncOptions& options,
                         TransferRunner& runner,
                         const FileValidator& validator,
                         SyncObserver* observer = nullptr);

// Process exit code for a finished run: the transfer exit code when non-zero,
// otherwise 1 when permanent failures or blocked paths remain, otherwise 0.
int exitCodeFor(const DownloadResult& result);

} // namespace tabsync

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "tabsync/events.hpp"
#include "tabsync/models.hpp"

namespace tabsync {

struct PlanResult {
    std::vector<DownloadTask> tasks;
    // File name -> local size for files already complete.
    std::map<std::string, uint64_t> sizeCache;
    // File names occupied by a directory; never scheduled.
    std::vector<std::string> blocked;
    // Manifest paths whose file name was already taken by an earlier path.
    std::vector<std::string> collisions;
};

// Decide which manifest paths need fetching. A path is complete when
// localDir/<last segment> is a regular file with at least one byte; anything
// else except a directory is scheduled as baseUrl + path. Emits one
// PlanProgress event per path.
PlanResult planDownloads(const std::vector<std::string>& paths,
                         const std::string& baseUrl,
                         const std::string& localDir,
                         SyncObserver* observer = nullptr);

} // namespace tabsync

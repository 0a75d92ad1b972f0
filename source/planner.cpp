#include "tabsync/planner.hpp"
#include "tabsync/filesystem.hpp"
#include "tabsync/logger.hpp"
#include "tabsync/util.hpp"
#include <unordered_map>

namespace tabsync {

PlanResult planDownloads(const std::vector<std::string>& paths,
                         const std::string& baseUrl,
                         const std::string& localDir,
                         SyncObserver* observer) {
    PlanResult plan;
    std::unordered_map<std::string, std::string> firstPathByName;
    std::unordered_map<std::string, size_t> taskIndexByName;

    SyncEvent progress;
    progress.kind = SyncEventKind::PlanProgress;
    progress.total = paths.size();

    for (size_t i = 0; i < paths.size(); ++i) {
        const std::string& path = paths[i];
        const std::string name = util::lastPathSegment(path);

        auto seen = firstPathByName.find(name);
        if (seen != firstPathByName.end()) {
            logWarn("File name collision: " + path + " and " + seen->second + " both map to " + name, "PLAN");
            plan.collisions.push_back(path);
        } else {
            firstPathByName.emplace(name, path);
        }

        uint64_t size = 0;
        LocalFileState state = classifyLocalFile(joinPath(localDir, name), size);
        switch (state) {
        case LocalFileState::Complete:
            plan.sizeCache[name] = size;
            break;
        case LocalFileState::Directory:
            logError("A directory occupies " + joinPath(localDir, name) + "; remove it to download " + path, "PLAN");
            plan.blocked.push_back(name);
            break;
        case LocalFileState::Unreadable:
            logWarn("Cannot inspect " + joinPath(localDir, name) + "; scheduling download", "PLAN");
            [[fallthrough]];
        case LocalFileState::Missing:
        case LocalFileState::Empty: {
            DownloadTask task{baseUrl + path, name};
            auto idx = taskIndexByName.find(name);
            if (idx != taskIndexByName.end()) {
                plan.tasks[idx->second] = task;
            } else {
                taskIndexByName.emplace(name, plan.tasks.size());
                plan.tasks.push_back(task);
            }
            break;
        }
        }

        progress.completed = i + 1;
        notify(observer, progress);
    }

    logDebug("Planned " + std::to_string(plan.tasks.size()) + " of " + std::to_string(paths.size()) +
                 " file(s); " + std::to_string(plan.sizeCache.size()) + " already complete",
             "PLAN");
    return plan;
}

} // namespace tabsync

#include "tabsync/session.hpp"
#include "tabsync/filesystem.hpp"
#include "tabsync/logger.hpp"
#include "tabsync/util.hpp"
#include <cctype>
#include <fstream>
#include <unordered_set>

namespace tabsync {

std::set<std::string> loadPendingUrls(const std::string& sessionFile) {
    std::set<std::string> urls;
    if (!fileExists(sessionFile)) return urls;
    std::ifstream in(sessionFile);
    if (!in) {
        logWarn("Cannot read session file " + sessionFile + "; ignoring it", "SESS");
        return urls;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || std::isspace(static_cast<unsigned char>(line[0]))) continue;
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.pop_back();
        if (util::startsWith(line, "http")) urls.insert(line);
    }
    logDebug("Session file lists " + std::to_string(urls.size()) + " pending URL(s)", "SESS");
    return urls;
}

size_t mergePendingUrls(std::vector<DownloadTask>& tasks,
                        const std::set<std::string>& urls,
                        std::vector<std::string>* collisions) {
    std::unordered_set<std::string> scheduled;
    std::unordered_set<std::string> names;
    for (const auto& t : tasks) {
        scheduled.insert(t.url);
        names.insert(t.fileName);
    }
    size_t added = 0;
    for (const auto& url : urls) {
        if (scheduled.count(url)) continue;
        std::string name = util::lastPathSegment(url);
        if (name.empty()) {
            logWarn("Ignoring session URL without a file name: " + url, "SESS");
            continue;
        }
        // aria2c runs with auto-renaming off, so one name can be fetched from one URL only.
        if (!names.insert(name).second) {
            logWarn("File name collision: session URL " + url + " maps to already scheduled " + name + "; ignoring it",
                    "SESS");
            if (collisions) collisions->push_back(url);
            continue;
        }
        tasks.push_back(DownloadTask{url, name});
        scheduled.insert(url);
        ++added;
    }
    if (added > 0) logInfo("Resuming " + std::to_string(added) + " download(s) from previous session", "SESS");
    return added;
}

bool removeSessionFile(const std::string& sessionFile) {
    std::string err;
    if (!removeFile(sessionFile, err)) {
        logWarn("Could not remove session file: " + err, "SESS");
        return false;
    }
    return true;
}

} // namespace tabsync

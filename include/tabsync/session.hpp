#pragma once

#include <set>
#include <string>
#include <vector>

#include "tabsync/models.hpp"

namespace tabsync {

// URLs listed in an aria2c session file: lines starting with "http" at
// column zero. Option lines (indented) and blanks are ignored. A missing or
// unreadable file yields an empty set.
std::set<std::string> loadPendingUrls(const std::string& sessionFile);

// Append a task for every pending URL not already scheduled. The file name is
// the URL's last path segment. A URL whose file name is already scheduled is
// skipped and appended to collisions when given. Returns the number of tasks added.
size_t mergePendingUrls(std::vector<DownloadTask>& tasks,
                        const std::set<std::string>& urls,
                        std::vector<std::string>* collisions = nullptr);

// Delete the session file. Missing counts as removed; failures are logged.
bool removeSessionFile(const std::string& sessionFile);

} // namespace tabsync

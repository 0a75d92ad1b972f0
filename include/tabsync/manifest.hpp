#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "tabsync/config.hpp"

namespace tabsync {

// A manifest path is relative and stays inside the download root: not empty,
// not absolute (Unix, "\\" or drive-letter style), no ".." segment
// and no trailing separator.
bool isSafeManifestPath(const std::string& path);

// Flatten {"files": {"<category>": ["a/b.parquet", ...], ...}} into one list.
// Categories are visited in key order; entries keep their manifest order.
// Non-array categories and non-string entries are ignored; unsafe paths are
// dropped and counted in rejected. A missing "files" key yields an empty list.
bool extractFilePaths(const std::string& json,
                      std::vector<std::string>& outPaths,
                      size_t& rejected,
                      std::string& err);

// Retrieve the manifest body from cfg.manifestUrl. Local paths and file:// are
// read from disk, http:// uses the built-in client and https:// is fetched
// with the configured transfer tool.
bool fetchManifest(const Config& cfg, std::string& body, std::string& err);

} // namespace tabsync

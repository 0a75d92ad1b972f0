#pragma once

#include <cstdint>
#include <string>

namespace tabsync {

enum class LocalFileState {
    Missing,    // nothing at the path
    Empty,      // regular file of size zero
    Complete,   // regular file with at least one byte
    Directory,  // a directory occupies the path
    Unreadable  // stat failed for a reason other than absence, or not a regular file
};

const char* localFileStateLabel(LocalFileState state);

// Inspect path without following it into directories. sizeOut is set for Complete.
LocalFileState classifyLocalFile(const std::string& path, uint64_t& sizeOut);

// Ensure a directory exists, creating it if necessary.
bool ensureDirectory(const std::string& path);
bool fileExists(const std::string& path);
bool isRegularFile(const std::string& path);
// Remove a file. Missing files count as removed.
bool removeFile(const std::string& path, std::string& err);

bool readTextFile(const std::string& path, std::string& out, std::string& err);

// Create a private directory under $TMPDIR (or /tmp) named prefix + random suffix.
bool makeTempDirectory(const std::string& prefix, std::string& outPath, std::string& err);
// Best-effort recursive delete.
void removeTree(const std::string& path);

std::string joinPath(const std::string& dir, const std::string& name);

} // namespace tabsync

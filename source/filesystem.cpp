#include "tabsync/filesystem.hpp"
#include "tabsync/logger.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <vector>

namespace tabsync {

const char* localFileStateLabel(LocalFileState state) {
    switch (state) {
        case LocalFileState::Missing: return "missing";
        case LocalFileState::Empty: return "empty";
        case LocalFileState::Complete: return "complete";
        case LocalFileState::Directory: return "directory";
        case LocalFileState::Unreadable: return "unreadable";
    }
    return "unknown";
}

LocalFileState classifyLocalFile(const std::string& path, uint64_t& sizeOut) {
    sizeOut = 0;
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) return LocalFileState::Missing;
        logDebug("stat failed for " + path + ": " + std::strerror(errno), "FS");
        return LocalFileState::Unreadable;
    }
    if (S_ISDIR(st.st_mode)) return LocalFileState::Directory;
    if (!S_ISREG(st.st_mode)) return LocalFileState::Unreadable;
    if (st.st_size <= 0) return LocalFileState::Empty;
    sizeOut = static_cast<uint64_t>(st.st_size);
    return LocalFileState::Complete;
}

bool ensureDirectory(const std::string& path) {
    std::filesystem::path p(path);
    std::error_code ec;
    std::filesystem::create_directories(p, ec);
    bool ok = std::filesystem::is_directory(p, ec);
    if (!ok) logError("Failed to ensure directory: " + path, "FS");
    return ok;
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::path(path), ec);
}

bool isRegularFile(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(std::filesystem::path(path), ec);
}

bool removeFile(const std::string& path, std::string& err) {
    std::error_code ec;
    std::filesystem::remove(std::filesystem::path(path), ec);
    if (ec) {
        err = "Failed to remove " + path + ": " + ec.message();
        return false;
    }
    return true;
}

bool readTextFile(const std::string& path, std::string& out, std::string& err) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        err = "Open failed for " + path + ": " + std::strerror(errno);
        return false;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        err = "Read failed for " + path;
        return false;
    }
    out = ss.str();
    return true;
}

bool makeTempDirectory(const std::string& prefix, std::string& outPath, std::string& err) {
    const char* tmp = std::getenv("TMPDIR");
    std::string base = (tmp && *tmp) ? tmp : "/tmp";
    std::string templ = joinPath(base, prefix + "XXXXXX");
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        err = "Failed to create temporary directory in " + base + ": " + std::strerror(errno);
        return false;
    }
    outPath = buf.data();
    return true;
}

void removeTree(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::path(path), ec);
    if (ec) logWarn("Failed to remove " + path + ": " + ec.message(), "FS");
}

std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

} // namespace tabsync

#include "tabsync/logger.hpp"
#include "tabsync/util.hpp"
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace tabsync {

static constexpr size_t kMaxLogBytes = 8 * 1024 * 1024; // one rotation at 8 MiB
static LogLevel gMinLevel = LogLevel::Info;
static std::mutex gLogMutex;
static std::ofstream gLogFile;
static std::string gLogPath;
static size_t gLogBytes = 0;
static bool gProgressPending = false;

static const char* levelLabel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

static std::string timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

void setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    gMinLevel = level;
}

void setLogLevelFromString(const std::string& level) {
    std::string l = util::toLower(level);
    if (l == "debug") setLogLevel(LogLevel::Debug);
    else if (l == "warn" || l == "warning") setLogLevel(LogLevel::Warn);
    else if (l == "error") setLogLevel(LogLevel::Error);
    else setLogLevel(LogLevel::Info);
}

LogLevel logLevel() {
    std::lock_guard<std::mutex> lock(gLogMutex);
    return gMinLevel;
}

bool openLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogFile.open(path, std::ios::app);
    if (!gLogFile) {
        gLogPath.clear();
        return false;
    }
    gLogPath = path;
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    gLogBytes = ec ? 0 : static_cast<size_t>(size);
    return true;
}

void closeLogFile() {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogPath.clear();
    gLogBytes = 0;
}

// Caller holds gLogMutex.
static void rotateLocked() {
    if (gLogFile.is_open()) gLogFile.close();
    std::error_code ec;
    std::filesystem::path p(gLogPath);
    std::filesystem::path rotated = p;
    rotated += ".1";
    std::filesystem::remove(rotated, ec);
    ec.clear();
    std::filesystem::rename(p, rotated, ec); // best-effort
    gLogFile.open(gLogPath, std::ios::trunc);
    gLogBytes = 0;
}

static void logInternal(LogLevel level, const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(gLogMutex);

    if (level >= gMinLevel) {
        if (gProgressPending) {
            std::cout << "\n";
            gProgressPending = false;
        }
        std::ostream& os = level >= LogLevel::Warn ? std::cerr : std::cout;
        if (gMinLevel == LogLevel::Debug) {
            os << levelLabel(level) << " [" << tag << "] " << msg << std::endl;
        } else if (level >= LogLevel::Warn) {
            os << levelLabel(level) << ": " << msg << std::endl;
        } else {
            os << msg << std::endl;
        }
    }

    if (!gLogFile.is_open()) return;
    std::string line = timestamp() + " " + levelLabel(level) + " [" + tag + "] " + msg;
    size_t writeBytes = line.size() + 1; // newline
    if (gLogBytes + writeBytes > kMaxLogBytes) {
        rotateLocked();
    }
    if (gLogFile) {
        gLogFile << line << "\n";
        gLogFile.flush();
        gLogBytes += writeBytes;
    }
}

void logDebug(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Debug, tag, msg); }
void logInfo(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Info, tag, msg); }
void logWarn(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Warn, tag, msg); }
void logError(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Error, tag, msg); }

void writeProgress(const std::string& text) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    std::cout << "\r" << text << std::flush;
    gProgressPending = true;
}

void endProgress() {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (!gProgressPending) return;
    std::cout << std::endl;
    gProgressPending = false;
}

} // namespace tabsync

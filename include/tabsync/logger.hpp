#pragma once

#include <string>

namespace tabsync {

enum class LogLevel { Debug = 0, Info, Warn, Error };

// Console threshold. The log file, when open, always records Debug and up.
void setLogLevel(LogLevel level);
void setLogLevelFromString(const std::string& level);
LogLevel logLevel();

// Append timestamped log lines to path. Returns false if it cannot be opened.
bool openLogFile(const std::string& path);
void closeLogFile();

void logDebug(const std::string& msg, const std::string& tag = "DBG");
void logInfo(const std::string& msg, const std::string& tag = "APP");
void logWarn(const std::string& msg, const std::string& tag = "APP");
void logError(const std::string& msg, const std::string& tag = "APP");

// In-place progress line on stdout ("\r" + text). Never written to the log file.
void writeProgress(const std::string& text);
// Terminates a pending progress line, if any.
void endProgress();

} // namespace tabsync

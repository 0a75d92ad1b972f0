#pragma once

#include <string>
#include <utility>
#include <vector>

#include "tabsync/config.hpp"
#include "tabsync/models.hpp"

namespace tabsync {

// Exit status reported when the transfer tool could not be started at all.
constexpr int kTransferLaunchFailed = 127;

constexpr int kSaveSessionIntervalSec = 10;
constexpr int kSummaryIntervalSec = 5;

// Runs one bulk transfer over a task list and reports the tool's exit status.
class TransferRunner {
public:
    virtual ~TransferRunner() = default;
    virtual int run(const std::vector<DownloadTask>& tasks) = 0;
};

// aria2c-backed runner. Blocks until the process exits; no timeout.
class Aria2Runner : public TransferRunner {
public:
    explicit Aria2Runner(Config cfg) : cfg_(std::move(cfg)) {}
    int run(const std::vector<DownloadTask>& tasks) override;

private:
    Config cfg_;
};

// "URL\n  out=<name>\n" per task, in order.
std::string formatTransferInput(const std::vector<DownloadTask>& tasks);

// Write the input list to a new, uniquely named temporary file.
bool writeTransferInput(const std::vector<DownloadTask>& tasks, std::string& outPath, std::string& err);

std::vector<std::string> buildTransferCommand(const Config& cfg, const std::string& inputPath);

// fork/exec argv[0] (PATH lookup) with inherited stdio and wait for it.
// Returns the exit status, 128 + signal number for a killed child, or
// kTransferLaunchFailed with err set when the process could not be started.
int runProcess(const std::vector<std::string>& argv, std::string& err);

} // namespace tabsync

#include "tabsync/transfer.hpp"
#include "tabsync/filesystem.hpp"
#include "tabsync/logger.hpp"
#include "tabsync/raii.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace tabsync {

std::string formatTransferInput(const std::vector<DownloadTask>& tasks) {
    std::ostringstream oss;
    for (const auto& t : tasks) {
        oss << t.url << "\n";
        oss << "  out=" << t.fileName << "\n";
    }
    return oss.str();
}

bool writeTransferInput(const std::vector<DownloadTask>& tasks, std::string& outPath, std::string& err) {
    const char* tmp = std::getenv("TMPDIR");
    std::string templ = joinPath((tmp && *tmp) ? tmp : "/tmp", "aria2c_input_XXXXXX.txt");
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');

    UniqueFd fd(::mkstemps(buf.data(), 4));
    if (!fd) {
        err = "Failed to create transfer input file: " + std::string(std::strerror(errno));
        return false;
    }
    outPath = buf.data();

    const std::string contents = formatTransferInput(tasks);
    size_t written = 0;
    while (written < contents.size()) {
        ssize_t n = ::write(fd.fd, contents.data() + written, contents.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            err = "Write failed for " + outPath + ": " + std::strerror(errno);
            ::unlink(outPath.c_str());
            return false;
        }
        written += static_cast<size_t>(n);
    }
    if (::close(fd.release()) != 0) {
        err = "Write failed for " + outPath + ": " + std::strerror(errno);
        ::unlink(outPath.c_str());
        return false;
    }
    return true;
}

std::vector<std::string> buildTransferCommand(const Config& cfg, const std::string& inputPath) {
    return {
        cfg.aria2cPath,
        "-c",
        "--save-session=" + cfg.sessionFile(),
        "--save-session-interval=" + std::to_string(kSaveSessionIntervalSec),
        "-j" + std::to_string(cfg.concurrentDownloads),
        "-d" + cfg.downloadDir,
        "--auto-file-renaming=false",
        "--console-log-level=notice",
        "--summary-interval=" + std::to_string(kSummaryIntervalSec),
        "--file-allocation=" + cfg.fileAllocation,
        "-i" + inputPath,
    };
}

int runProcess(const std::vector<std::string>& argv, std::string& err) {
    if (argv.empty() || argv[0].empty()) {
        err = "Failed to launch transfer tool: empty command";
        return kTransferLaunchFailed;
    }

    std::vector<char*> cArgs;
    cArgs.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cArgs.push_back(const_cast<char*>(arg.c_str()));
    }
    cArgs.push_back(nullptr);

    // The child reports an exec failure through a close-on-exec pipe.
    int errPipe[2];
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        err = "Failed to launch " + argv[0] + ": pipe: " + std::strerror(errno);
        return kTransferLaunchFailed;
    }
    UniqueFd readEnd(errPipe[0]);
    UniqueFd writeEnd(errPipe[1]);

    pid_t pid = ::fork();
    if (pid < 0) {
        err = "Failed to launch " + argv[0] + ": fork: " + std::strerror(errno);
        return kTransferLaunchFailed;
    }
    if (pid == 0) {
        ::execvp(cArgs[0], cArgs.data());
        int execErrno = errno;
        ssize_t ignored = ::write(writeEnd.fd, &execErrno, sizeof(execErrno));
        (void)ignored;
        ::_exit(kTransferLaunchFailed);
    }

    writeEnd.reset();
    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(readEnd.fd, &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        err = "Failed to launch " + argv[0] + ": exec failed: " + std::strerror(childErrno);
        return kTransferLaunchFailed;
    }
    if (waited < 0) {
        err = "Failed to wait for " + argv[0] + ": " + std::strerror(errno);
        return kTransferLaunchFailed;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) {
        err = argv[0] + " killed by signal " + std::to_string(WTERMSIG(status));
        return 128 + WTERMSIG(status);
    }
    return kTransferLaunchFailed;
}

int Aria2Runner::run(const std::vector<DownloadTask>& tasks) {
    if (!ensureDirectory(cfg_.downloadDir)) {
        logError("Cannot create download directory " + cfg_.downloadDir, "XFER");
        return kTransferLaunchFailed;
    }

    std::string inputPath;
    std::string err;
    if (!writeTransferInput(tasks, inputPath, err)) {
        logError(err, "XFER");
        return kTransferLaunchFailed;
    }
    auto removeInput = make_scope_guard([&inputPath]() {
        std::string rmErr;
        if (!removeFile(inputPath, rmErr)) logWarn(rmErr, "XFER");
    });

    auto argv = buildTransferCommand(cfg_, inputPath);
    logDebug("Running " + cfg_.aria2cPath + " with " + std::to_string(tasks.size()) + " task(s), input " + inputPath,
             "XFER");
    int code = runProcess(argv, err);
    if (!err.empty()) logError(err, "XFER");
    else if (code != 0) logWarn(cfg_.aria2cPath + " exited with code " + std::to_string(code), "XFER");
    return code;
}

} // namespace tabsync

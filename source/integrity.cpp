#include "tabsync/integrity.hpp"
#include "tabsync/filesystem.hpp"
#include "tabsync/logger.hpp"
#include "tabsync/parquet_footer.hpp"
#include "tabsync/raii.hpp"
#include "tabsync/util.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <system_error>
#include <thread>

namespace tabsync {

bool ParquetValidator::accepts(const std::string& fileName) const {
    return util::endsWith(util::toLower(fileName), ".parquet");
}

bool ParquetValidator::validate(const std::string& path, ErrorInfo& err) const {
    ParquetFooter footer;
    return readParquetFooter(path, footer, err);
}

namespace {

enum class Verdict { Skipped, Valid, Failed };

Verdict verifyOne(const std::string& localDir, const std::string& name, const FileValidator& validator) {
    const std::string path = joinPath(localDir, name);
    if (!validator.accepts(name) || !isRegularFile(path)) return Verdict::Skipped;
    if (fileExists(path + kTransferMarkerSuffix)) {
        logDebug("Skipping " + name + ": transfer still in progress", "VERIFY");
        return Verdict::Skipped;
    }

    ErrorInfo err;
    if (validator.validate(path, err)) return Verdict::Valid;

    if (err.category == ErrorCategory::Integrity) {
        logWarn("Corrupt file " + name + ": " + err.detail + "; deleting", "VERIFY");
        std::string rmErr;
        if (!removeFile(path, rmErr)) logWarn(rmErr, "VERIFY");
    } else {
        logWarn("Could not validate " + name + " (" + errorCodeLabel(err.code) + "): " + err.detail +
                    "; leaving it in place",
                "VERIFY");
    }
    return Verdict::Failed;
}

} // namespace

std::vector<std::string> verifyFiles(const std::string& localDir,
                                     const std::vector<std::string>& fileNames,
                                     int maxWorkers,
                                     const FileValidator& validator,
                                     SyncObserver* observer,
                                     int cycle) {
    std::vector<std::string> failed;
    if (fileNames.empty()) return failed;

    size_t workers = maxWorkers > 0 ? static_cast<size_t>(maxWorkers) : std::thread::hardware_concurrency();
    if (workers == 0) workers = 1;
    workers = std::min(workers, fileNames.size());

    std::atomic<size_t> next{0};
    std::atomic<size_t> completed{0};
    std::mutex failedMutex;
    const size_t total = fileNames.size();

    auto work = [&]() {
        for (size_t i = next.fetch_add(1); i < total; i = next.fetch_add(1)) {
            const std::string& name = fileNames[i];
            Verdict verdict = Verdict::Failed;
            try {
                verdict = verifyOne(localDir, name, validator);
            } catch (const std::exception& e) {
                logError("Validation of " + name + " threw: " + e.what(), "VERIFY");
            }
            if (verdict == Verdict::Failed) {
                std::lock_guard<std::mutex> lock(failedMutex);
                failed.push_back(name);
            }
            SyncEvent ev;
            ev.kind = SyncEventKind::ValidationProgress;
            ev.cycle = cycle;
            ev.completed = completed.fetch_add(1) + 1;
            ev.total = total;
            notify(observer, ev);
        }
    };

    {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        auto joinPool = make_scope_guard([&pool]() {
            for (auto& t : pool) {
                if (t.joinable()) t.join();
            }
        });
        for (size_t w = 0; w < workers; ++w) {
            try {
                pool.emplace_back(work);
            } catch (const std::system_error& e) {
                logWarn(std::string("Could not start validation worker: ") + e.what() + "; continuing with " +
                            std::to_string(pool.size()),
                        "VERIFY");
                break;
            }
        }
        // No worker could be started; validate on this thread.
        if (pool.empty()) work();
    }

    logDebug("Validated " + std::to_string(total) + " file(s), " + std::to_string(failed.size()) + " failed",
             "VERIFY");
    return failed;
}

} // namespace tabsync

#include "catch.hpp"
#include "test_support.hpp"
#include "tabsync/sync.hpp"

#include <atomic>
#include <cerrno>
#include <functional>
#include <stdexcept>

using testsupport::TempDir;
using testsupport::readFile;
using testsupport::writeFile;

namespace {

// Writes each task's file into the download directory and returns scripted exit codes.
class FakeRunner : public tabsync::TransferRunner {
public:
    explicit FakeRunner(std::string dir) : dir_(std::move(dir)) {}

    std::function<std::string(const std::string& name, int cycle)> content =
        [](const std::string&, int) { return std::string("good"); };
    std::vector<int> exitCodes;
    bool throwOnRun{false};
    std::vector<std::vector<tabsync::DownloadTask>> calls;

    int run(const std::vector<tabsync::DownloadTask>& tasks) override {
        calls.push_back(tasks);
        if (throwOnRun) throw std::runtime_error("runner exploded");
        int cycle = static_cast<int>(calls.size());
        int code = exitCodes.size() >= calls.size() ? exitCodes[calls.size() - 1] : 0;
        if (code == 0) {
            for (const auto& t : tasks) {
                std::string body = content(t.fileName, cycle);
                if (!body.empty()) writeFile(tabsync::joinPath(dir_, t.fileName), body);
            }
        }
        return code;
    }

private:
    std::string dir_;
};

// Content "BAD..." is corrupt, "LOCK..." cannot be checked, anything else is valid.
class ContentValidator : public tabsync::FileValidator {
public:
    mutable std::atomic<int> calls{0};

    bool accepts(const std::string& fileName) const override {
        return fileName.find(".parquet") != std::string::npos;
    }
    bool validate(const std::string& path, tabsync::ErrorInfo& err) const override {
        ++calls;
        std::string body = readFile(path);
        if (body.rfind("BAD", 0) == 0) {
            err = tabsync::corruptFileError("bad content");
            return false;
        }
        if (body.rfind("LOCK", 0) == 0) {
            err = tabsync::errorFromErrno(EACCES, "Open failed for " + path);
            return false;
        }
        return true;
    }
};

tabsync::Config testConfig(const TempDir& dir) {
    tabsync::Config cfg;
    cfg.downloadDir = dir.path();
    cfg.baseUrl = "https://h/";
    return cfg;
}

} // namespace

TEST_CASE("syncFiles downloads only what is missing") {
    TempDir dir;
    auto cfg = testConfig(dir);
    REQUIRE(writeFile(dir.file("x.parquet"), std::string(100, 'x')));
    REQUIRE(writeFile(cfg.sessionFile(), "https://h/b/y.parquet\n  out=y.parquet\n"));

    FakeRunner runner(dir.path());
    ContentValidator validator;
    auto result = tabsync::syncFiles(cfg, {"a/x.parquet", "b/y.parquet"}, tabsync::SyncOptions{}, runner, validator);

    REQUIRE(runner.calls.size() == 1);
    REQUIRE(runner.calls[0] == std::vector<tabsync::DownloadTask>{{"https://h/b/y.parquet", "y.parquet"}});
    REQUIRE(result.totalFiles == 2);
    REQUIRE(result.skippedFiles == 1);
    REQUIRE(result.attemptedFiles == 1);
    REQUIRE(result.exitCode == 0);
    REQUIRE(result.integrityFailures == 0);
    REQUIRE(result.integrityRetries == 0);
    REQUIRE(result.outcome == tabsync::SyncOutcome::Converged);
    REQUIRE_FALSE(tabsync::fileExists(cfg.sessionFile()));
    REQUIRE(tabsync::exitCodeFor(result) == 0);
}

TEST_CASE("syncFiles gives up after the retry budget") {
    TempDir dir;
    auto cfg = testConfig(dir);
    FakeRunner runner(dir.path());
    runner.content = [](const std::string&, int) { return std::string("BAD bytes"); };
    ContentValidator validator;

    tabsync::SyncOptions opts;
    opts.maxIntegrityRetries = 3;
    auto result = tabsync::syncFiles(cfg, {"c/c.parquet"}, opts, runner, validator);

    REQUIRE(runner.calls.size() == 3);
    REQUIRE(result.integrityRetries == 3);
    REQUIRE(result.integrityFailures == 1);
    REQUIRE(result.failedFiles == std::vector<std::string>{"c.parquet"});
    REQUIRE(result.outcome == tabsync::SyncOutcome::RetryBudgetExhausted);
    REQUIRE_FALSE(tabsync::fileExists(dir.file("c.parquet")));
    REQUIRE(tabsync::exitCodeFor(result) == 1);
}

TEST_CASE("syncFiles stops on a failed transfer without verifying") {
    TempDir dir;
    auto cfg = testConfig(dir);
    REQUIRE(writeFile(cfg.sessionFile(), "https://h/a/a.parquet\n  out=a.parquet\n"));
    FakeRunner runner(dir.path());
    runner.exitCodes = {7};
    ContentValidator validator;

    auto result = tabsync::syncFiles(cfg, {"a/a.parquet", "b/b.parquet"}, tabsync::SyncOptions{}, runner, validator);
    REQUIRE(runner.calls.size() == 1);
    REQUIRE(validator.calls.load() == 0);
    REQUIRE(result.exitCode == 7);
    REQUIRE(result.outcome == tabsync::SyncOutcome::TransferFailed);
    REQUIRE(tabsync::fileExists(cfg.sessionFile()));
    REQUIRE(tabsync::exitCodeFor(result) == 7);
}

TEST_CASE("syncFiles retries only the failed files with their original URLs") {
    TempDir dir;
    auto cfg = testConfig(dir);
    FakeRunner runner(dir.path());
    runner.content = [](const std::string& name, int cycle) {
        return (name == "b.parquet" && cycle == 1) ? std::string("BAD") : std::string("good");
    };
    ContentValidator validator;

    auto result =
        tabsync::syncFiles(cfg, {"one/a.parquet", "two/b.parquet"}, tabsync::SyncOptions{}, runner, validator);
    REQUIRE(runner.calls.size() == 2);
    REQUIRE(runner.calls[1] == std::vector<tabsync::DownloadTask>{{"https://h/two/b.parquet", "b.parquet"}});
    REQUIRE(result.integrityRetries == 1);
    REQUIRE(result.integrityFailures == 0);
    REQUIRE(result.outcome == tabsync::SyncOutcome::Converged);
    REQUIRE(readFile(dir.file("b.parquet")) == "good");
}

TEST_CASE("syncFiles never deletes files whose check is inconclusive") {
    TempDir dir;
    auto cfg = testConfig(dir);
    FakeRunner runner(dir.path());
    runner.content = [](const std::string&, int) { return std::string("LOCKED"); };
    ContentValidator validator;

    tabsync::SyncOptions opts;
    opts.maxIntegrityRetries = 4;
    auto result = tabsync::syncFiles(cfg, {"d/d.parquet"}, opts, runner, validator);
    REQUIRE(runner.calls.size() == 4);
    REQUIRE(result.integrityFailures == 1);
    REQUIRE(tabsync::fileExists(dir.file("d.parquet")));
}

TEST_CASE("syncFiles resumes URLs from the previous session") {
    TempDir dir;
    auto cfg = testConfig(dir);
    REQUIRE(writeFile(dir.file("x.parquet"), "partial"));
    REQUIRE(writeFile(cfg.sessionFile(), "https://h/a/x.parquet\n  out=x.parquet\n"));
    FakeRunner runner(dir.path());
    ContentValidator validator;

    auto result = tabsync::syncFiles(cfg, {"a/x.parquet"}, tabsync::SyncOptions{}, runner, validator);
    REQUIRE(runner.calls.size() == 1);
    REQUIRE(runner.calls[0] == std::vector<tabsync::DownloadTask>{{"https://h/a/x.parquet", "x.parquet"}});
    REQUIRE(result.sessionResumed == 1);
    REQUIRE(result.skippedFiles == 0);
    REQUIRE(result.attemptedFiles == 1);
    REQUIRE_FALSE(tabsync::fileExists(cfg.sessionFile()));
}

TEST_CASE("syncFiles ignores session URLs that reuse a planned file name") {
    TempDir dir;
    auto cfg = testConfig(dir);
    REQUIRE(writeFile(cfg.sessionFile(), "https://old-mirror/a/x.parquet\n  out=x.parquet\n"));
    FakeRunner runner(dir.path());
    ContentValidator validator;

    auto result = tabsync::syncFiles(cfg, {"a/x.parquet"}, tabsync::SyncOptions{}, runner, validator);
    REQUIRE(runner.calls.size() == 1);
    REQUIRE(runner.calls[0] == std::vector<tabsync::DownloadTask>{{"https://h/a/x.parquet", "x.parquet"}});
    REQUIRE(result.attemptedFiles == 1);
    REQUIRE(result.sessionResumed == 0);
    REQUIRE(result.nameCollisions == 1);
    REQUIRE(validator.calls.load() == 1);
    REQUIRE(result.outcome == tabsync::SyncOutcome::Converged);
}

TEST_CASE("syncFiles does not count colliding missing paths as complete") {
    TempDir dir;
    auto cfg = testConfig(dir);
    FakeRunner runner(dir.path());
    ContentValidator validator;

    auto result = tabsync::syncFiles(cfg, {"a/x.parquet", "b/x.parquet"}, tabsync::SyncOptions{}, runner, validator);
    REQUIRE(runner.calls.size() == 1);
    REQUIRE(runner.calls[0] == std::vector<tabsync::DownloadTask>{{"https://h/b/x.parquet", "x.parquet"}});
    REQUIRE(result.totalFiles == 2);
    REQUIRE(result.skippedFiles == 0);
    REQUIRE(result.attemptedFiles == 1);
    REQUIRE(result.nameCollisions == 1);
}

TEST_CASE("syncFiles counts colliding complete paths as skipped") {
    TempDir dir;
    auto cfg = testConfig(dir);
    REQUIRE(writeFile(dir.file("x.parquet"), "complete"));
    FakeRunner runner(dir.path());
    ContentValidator validator;

    auto result = tabsync::syncFiles(cfg, {"a/x.parquet", "b/x.parquet"}, tabsync::SyncOptions{}, runner, validator);
    REQUIRE(runner.calls.empty());
    REQUIRE(result.skippedFiles == 2);
    REQUIRE(result.outcome == tabsync::SyncOutcome::NothingToDo);
}

TEST_CASE("syncFiles with nothing to do removes a stale session file") {
    TempDir dir;
    auto cfg = testConfig(dir);
    REQUIRE(writeFile(dir.file("x.parquet"), "complete"));
    REQUIRE(writeFile(cfg.sessionFile(), "  out=x.parquet\n"));
    FakeRunner runner(dir.path());
    ContentValidator validator;

    auto result = tabsync::syncFiles(cfg, {"a/x.parquet"}, tabsync::SyncOptions{}, runner, validator);
    REQUIRE(runner.calls.empty());
    REQUIRE(result.outcome == tabsync::SyncOutcome::NothingToDo);
    REQUIRE(result.skippedFiles == 1);
    REQUIRE(result.attemptedFiles == 0);
    REQUIRE_FALSE(tabsync::fileExists(cfg.sessionFile()));
}

TEST_CASE("syncFiles dry run plans without transferring") {
    TempDir dir;
    auto cfg = testConfig(dir);
    REQUIRE(writeFile(cfg.sessionFile(), "https://h/a/a.parquet\n"));
    FakeRunner runner(dir.path());
    ContentValidator validator;

    tabsync::SyncOptions opts;
    opts.dryRun = true;
    auto result = tabsync::syncFiles(cfg, {"a/a.parquet", "b/b.parquet"}, opts, runner, validator);
    REQUIRE(runner.calls.empty());
    REQUIRE(result.outcome == tabsync::SyncOutcome::DryRun);
    REQUIRE(result.plannedFiles == 2);
    REQUIRE(result.attemptedFiles == 0);
    REQUIRE(tabsync::fileExists(cfg.sessionFile()));
    REQUIRE(tabsync::exitCodeFor(result) == 0);
}

TEST_CASE("syncFiles skips verification when integrity checking is off") {
    TempDir dir;
    auto cfg = testConfig(dir);
    FakeRunner runner(dir.path());
    runner.content = [](const std::string&, int) { return std::string("BAD"); };
    ContentValidator validator;

    tabsync::SyncOptions opts;
    opts.integrityCheck = false;
    auto result = tabsync::syncFiles(cfg, {"a/a.parquet"}, opts, runner, validator);
    REQUIRE(runner.calls.size() == 1);
    REQUIRE(validator.calls.load() == 0);
    REQUIRE(result.outcome == tabsync::SyncOutcome::Converged);
}

TEST_CASE("syncFiles pre-check only touches manifest files") {
    TempDir dir;
    auto cfg = testConfig(dir);
    REQUIRE(writeFile(dir.file("x.parquet"), "BAD old copy"));
    REQUIRE(writeFile(dir.file("unrelated.parquet"), "BAD but not ours"));
    FakeRunner runner(dir.path());
    ContentValidator validator;

    tabsync::SyncOptions opts;
    opts.runIntegrity = true;
    auto result = tabsync::syncFiles(cfg, {"a/x.parquet"}, opts, runner, validator);
    REQUIRE(result.preCheckFailures == 1);
    REQUIRE(runner.calls.size() == 1);
    REQUIRE(readFile(dir.file("x.parquet")) == "good");
    REQUIRE(readFile(dir.file("unrelated.parquet")) == "BAD but not ours");
    REQUIRE(result.outcome == tabsync::SyncOutcome::Converged);
}

TEST_CASE("syncFiles emits the cycle events in order") {
    TempDir dir;
    auto cfg = testConfig(dir);
    FakeRunner runner(dir.path());
    ContentValidator validator;
    tabsync::SyncEventQueue events;

    tabsync::syncFiles(cfg, {"a/a.parquet"}, tabsync::SyncOptions{}, runner, validator, &events);
    std::vector<tabsync::SyncEventKind> kinds;
    for (const auto& ev : events.drain()) kinds.push_back(ev.kind);
    REQUIRE(kinds == std::vector<tabsync::SyncEventKind>{
                         tabsync::SyncEventKind::PlanProgress,
                         tabsync::SyncEventKind::PlanComputed,
                         tabsync::SyncEventKind::TransferCycleStarted,
                         tabsync::SyncEventKind::ValidationStarted,
                         tabsync::SyncEventKind::ValidationProgress,
                         tabsync::SyncEventKind::CycleFinished,
                     });
}

TEST_CASE("syncFiles converts exceptions into a failed result") {
    TempDir dir;
    auto cfg = testConfig(dir);
    REQUIRE(writeFile(cfg.sessionFile(), "https://h/a/a.parquet\n"));
    FakeRunner runner(dir.path());
    runner.throwOnRun = true;
    ContentValidator validator;

    tabsync::DownloadResult result;
    REQUIRE_NOTHROW(result = tabsync::syncFiles(cfg, {"a/a.parquet"}, tabsync::SyncOptions{}, runner, validator));
    REQUIRE(result.outcome == tabsync::SyncOutcome::TransferFailed);
    REQUIRE(tabsync::exitCodeFor(result) != 0);
    REQUIRE(tabsync::fileExists(cfg.sessionFile()));
}

TEST_CASE("exitCodeFor reflects blocked paths") {
    tabsync::DownloadResult result;
    REQUIRE(tabsync::exitCodeFor(result) == 0);
    result.blockedPaths = 1;
    REQUIRE(tabsync::exitCodeFor(result) == 1);
    result.exitCode = 22;
    REQUIRE(tabsync::exitCodeFor(result) == 22);
}

TEST_CASE("syncOptionsFromConfig copies integrity settings") {
    tabsync::Config cfg;
    cfg.integrityCheck = false;
    cfg.integrityRetryCount = 6;
    cfg.concurrentValidations = 2;
    auto opts = tabsync::syncOptionsFromConfig(cfg);
    REQUIRE_FALSE(opts.integrityCheck);
    REQUIRE(opts.maxIntegrityRetries == 6);
    REQUIRE(opts.maxValidationWorkers == 2);
    REQUIRE_FALSE(opts.dryRun);
    REQUIRE(std::string(tabsync::syncOutcomeLabel(tabsync::SyncOutcome::Converged)) == "Converged");
}

#pragma once

#include <string>
#include <vector>

#include "tabsync/errors.hpp"
#include "tabsync/events.hpp"

namespace tabsync {

// Suffix of the control file aria2c keeps next to a file it is still writing.
constexpr const char* kTransferMarkerSuffix = ".aria2";

// Structural check for one file format.
class FileValidator {
public:
    virtual ~FileValidator() = default;
    // Whether fileName is in the validated format.
    virtual bool accepts(const std::string& fileName) const = 0;
    // False with err.category == Integrity when the file is corrupt; any other
    // category means the check itself could not be completed.
    virtual bool validate(const std::string& path, ErrorInfo& err) const = 0;
};

class ParquetValidator : public FileValidator {
public:
    bool accepts(const std::string& fileName) const override;
    bool validate(const std::string& path, ErrorInfo& err) const override;
};

// Validate localDir/<name> for each name on a pool of worker threads and return
// the names that failed, in no particular order. Missing files, files the
// validator does not accept and files with a transfer marker are skipped.
// Corrupt files are deleted; files failing for any other reason are kept.
// maxWorkers <= 0 uses the hardware concurrency.
// Workers that cannot be started are dropped; the rest share the list.
std::vector<std::string> verifyFiles(const std::string& localDir,
                                     const std::vector<std::string>& fileNames,
                                     int maxWorkers,
                                     const FileValidator& validator,
                                     SyncObserver* observer = nullptr,
                                     int cycle = 0);

} // namespace tabsync

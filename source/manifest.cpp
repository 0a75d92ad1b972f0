#include "tabsync/manifest.hpp"
#include "tabsync/filesystem.hpp"
#include "tabsync/http_client.hpp"
#include "tabsync/logger.hpp"
#include "tabsync/raii.hpp"
#include "tabsync/transfer.hpp"
#include "tabsync/util.hpp"
#include "mini/json.hpp"
#include <algorithm>
#include <cctype>

namespace tabsync {

namespace {

const char* kManifestFileName = "manifest.json";

bool fetchViaTransferTool(const Config& cfg, std::string& body, std::string& err) {
    std::string tmpDir;
    if (!makeTempDirectory("tabsync_manifest_", tmpDir, err)) return false;
    auto cleanup = make_scope_guard([&tmpDir]() { removeTree(tmpDir); });

    std::vector<std::string> argv = {
        cfg.aria2cPath,
        "--allow-overwrite=true",
        "--auto-file-renaming=false",
        "--console-log-level=warn",
        "--summary-interval=0",
        "-d" + tmpDir,
        "-o" + std::string(kManifestFileName),
        cfg.manifestUrl,
    };
    logDebug("Fetching manifest with " + cfg.aria2cPath, "MAN");
    std::string runErr;
    int code = runProcess(argv, runErr);
    if (code != 0) {
        err = runErr.empty() ? cfg.aria2cPath + " exited with code " + std::to_string(code) : runErr;
        return false;
    }
    return readTextFile(joinPath(tmpDir, kManifestFileName), body, err);
}

} // namespace

bool isSafeManifestPath(const std::string& path) {
    if (path.empty()) return false;
    if (path[0] == '/' || path[0] == '\\') return false;
    if (path.back() == '/' || path.back() == '\\') return false; // no file name
    if (path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':') return false;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find_first_of("/\\", start);
        if (end == std::string::npos) end = path.size();
        if (path.compare(start, end - start, "..") == 0 && end - start == 2) return false;
        start = end + 1;
    }
    return true;
}

bool extractFilePaths(const std::string& json,
                      std::vector<std::string>& outPaths,
                      size_t& rejected,
                      std::string& err) {
    outPaths.clear();
    rejected = 0;
    mini::Object root;
    if (!mini::parse(json, root)) {
        err = "Invalid manifest JSON";
        return false;
    }
    auto filesIt = root.find("files");
    if (filesIt == root.end()) return true;
    if (filesIt->second.type != mini::Value::Type::Object) {
        logWarn("Manifest 'files' is not an object; nothing to sync", "MAN");
        return true;
    }

    std::vector<std::string> categories;
    categories.reserve(filesIt->second.object.size());
    for (const auto& kv : filesIt->second.object) categories.push_back(kv.first);
    std::sort(categories.begin(), categories.end());

    for (const auto& category : categories) {
        const mini::Value& entries = filesIt->second.object.at(category);
        if (entries.type != mini::Value::Type::Array) {
            logDebug("Skipping non-list manifest category: " + category, "MAN");
            continue;
        }
        for (const auto& v : entries.array) {
            if (v.type != mini::Value::Type::String) continue;
            if (!isSafeManifestPath(v.str)) {
                logWarn("Rejecting unsafe path in manifest: " + v.str, "MAN");
                ++rejected;
                continue;
            }
            outPaths.push_back(v.str);
        }
    }
    return true;
}

bool fetchManifest(const Config& cfg, std::string& body, std::string& err) {
    const std::string& url = cfg.manifestUrl;
    if (util::startsWith(url, "https://")) {
        return fetchViaTransferTool(cfg, body, err);
    }
    if (util::startsWith(url, "http://")) {
        HttpResponse resp;
        if (!httpGet(url, cfg.httpTimeoutSeconds, resp, err)) return false;
        body.swap(resp.body);
        return true;
    }
    std::string path = util::startsWith(url, "file://") ? url.substr(7) : url;
    return readTextFile(path, body, err);
}

} // namespace tabsync

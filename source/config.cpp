#include "tabsync/config.hpp"
#include "tabsync/logger.hpp"
#include "tabsync/util.hpp"
#include "mini/json.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace tabsync {

namespace {

const char* kDefaultEnvPath = "tabsync.env";
const char* kDefaultJsonPath = "tabsync.json";

bool readWholeFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) return false;
    std::ostringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return true;
}

bool setIntField(const std::string& key, const std::string& val, int& dst, std::string& err) {
    int parsed = 0;
    if (!util::parseInt(val, parsed)) {
        err = "Invalid config value for " + key + ": '" + val + "'";
        return false;
    }
    dst = parsed;
    return true;
}

bool setBoolField(const std::string& key, const std::string& val, bool& dst, std::string& err) {
    bool parsed = false;
    if (!util::parseBool(val, parsed)) {
        err = "Invalid config value for " + key + ": '" + val + "'";
        return false;
    }
    dst = parsed;
    return true;
}

} // namespace

std::string Config::sessionFile() const {
    return (std::filesystem::path(downloadDir) / ".aria2c-session").string();
}

bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError) {
    std::istringstream in(contents);
    std::string line;
    while (std::getline(in, line)) {
        util::trim(line);
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == ';') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = util::toLower(line.substr(0, pos));
        std::string val = line.substr(pos + 1);
        util::trim(key);
        util::trim(val);
        if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                                (val.front() == '\'' && val.back() == '\''))) {
            val = val.substr(1, val.size() - 2);
        }
        bool ok = true;
        if (key == "manifest_url") outCfg.manifestUrl = val;
        else if (key == "base_url") outCfg.baseUrl = val;
        else if (key == "download_dir") outCfg.downloadDir = val;
        else if (key == "aria2c_path") outCfg.aria2cPath = val;
        else if (key == "concurrent_downloads") ok = setIntField(key, val, outCfg.concurrentDownloads, outError);
        else if (key == "integrity_check") ok = setBoolField(key, val, outCfg.integrityCheck, outError);
        else if (key == "integrity_retry_count") ok = setIntField(key, val, outCfg.integrityRetryCount, outError);
        else if (key == "concurrent_validations") ok = setIntField(key, val, outCfg.concurrentValidations, outError);
        else if (key == "file_allocation") outCfg.fileAllocation = val;
        else if (key == "http_timeout_seconds") ok = setIntField(key, val, outCfg.httpTimeoutSeconds, outError);
        else if (key == "log_level") outCfg.logLevel = util::toLower(val);
        else if (key == "log_file") outCfg.logFile = val;
        else logDebug("Ignoring unknown config key: " + key, "CFG");
        if (!ok) return false;
    }
    return true;
}

bool parseJsonString(const std::string& contents, Config& outCfg, std::string& outError) {
    mini::Object obj;
    if (!mini::parse(contents, obj)) {
        outError = "Invalid config JSON.";
        return false;
    }
    auto getStr = [&](const char* key, std::string& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->second.type == mini::Value::Type::String) {
            out = it->second.str;
        }
    };
    auto getInt = [&](const char* key, int& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->second.type == mini::Value::Type::Number) {
            out = static_cast<int>(it->second.number);
        }
    };
    auto getBool = [&](const char* key, bool& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->second.type == mini::Value::Type::Bool) {
            out = it->second.boolean;
        }
    };
    getStr("manifest_url", outCfg.manifestUrl);
    getStr("base_url", outCfg.baseUrl);
    getStr("download_dir", outCfg.downloadDir);
    getStr("aria2c_path", outCfg.aria2cPath);
    getInt("concurrent_downloads", outCfg.concurrentDownloads);
    getBool("integrity_check", outCfg.integrityCheck);
    getInt("integrity_retry_count", outCfg.integrityRetryCount);
    getInt("concurrent_validations", outCfg.concurrentValidations);
    getStr("file_allocation", outCfg.fileAllocation);
    getInt("http_timeout_seconds", outCfg.httpTimeoutSeconds);
    getStr("log_file", outCfg.logFile);
    {
        std::string lvl;
        getStr("log_level", lvl);
        if (!lvl.empty()) outCfg.logLevel = util::toLower(lvl);
    }
    return true;
}

void applyOverrides(const ConfigOverrides& overrides, Config& cfg) {
    if (overrides.downloadDir && !overrides.downloadDir->empty()) cfg.downloadDir = *overrides.downloadDir;
    if (overrides.manifestUrl && !overrides.manifestUrl->empty()) cfg.manifestUrl = *overrides.manifestUrl;
    if (overrides.concurrentDownloads) cfg.concurrentDownloads = *overrides.concurrentDownloads;
    if (overrides.integrityRetryCount) cfg.integrityRetryCount = *overrides.integrityRetryCount;
    if (overrides.concurrentValidations) cfg.concurrentValidations = *overrides.concurrentValidations;
    if (overrides.integrityCheck) cfg.integrityCheck = *overrides.integrityCheck;
    if (overrides.logFile && !overrides.logFile->empty()) cfg.logFile = *overrides.logFile;
}

std::string deriveBaseUrl(const std::string& manifestUrl) {
    auto slash = manifestUrl.find_last_of('/');
    if (slash == std::string::npos) return "";
    // "http://host" has no path component: the base is the origin itself.
    auto scheme = manifestUrl.find("://");
    if (scheme != std::string::npos && slash < scheme + 3) return manifestUrl + "/";
    return manifestUrl.substr(0, slash + 1);
}

std::string expandPath(const std::string& path) {
    std::string p = path;
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/')) {
        const char* home = std::getenv("HOME");
        if (home && *home) p = std::string(home) + p.substr(1);
    }
    std::filesystem::path fp(p);
    std::error_code ec;
    if (fp.is_relative()) {
        auto abs = std::filesystem::absolute(fp, ec);
        if (!ec) fp = abs;
    }
    fp = fp.lexically_normal();
    std::string out = fp.string();
    // Keep "/x/y" rather than "/x/y/" so derived file paths stay canonical.
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

bool finalizeConfig(Config& cfg, std::string& outError) {
    if (cfg.manifestUrl.empty()) {
        outError = "Config missing manifest_url.";
        return false;
    }
    const bool remote = util::startsWith(cfg.manifestUrl, "http://") || util::startsWith(cfg.manifestUrl, "https://");
    const bool local = util::startsWith(cfg.manifestUrl, "file://") || cfg.manifestUrl.find("://") == std::string::npos;
    if (!remote && !local) {
        outError = "Unsupported URL scheme in manifest_url: " + cfg.manifestUrl;
        return false;
    }
    if (cfg.downloadDir.empty()) {
        outError = "Config missing download_dir.";
        return false;
    }
    if (cfg.aria2cPath.empty()) {
        outError = "Config missing aria2c_path.";
        return false;
    }
    if (cfg.concurrentDownloads < 1) {
        outError = "Invalid config: concurrent_downloads must be at least 1.";
        return false;
    }
    if (cfg.integrityRetryCount < 1) {
        outError = "Invalid config: integrity_retry_count must be at least 1.";
        return false;
    }
    if (cfg.concurrentValidations < 0) {
        outError = "Invalid config: concurrent_validations must not be negative.";
        return false;
    }
    if (cfg.httpTimeoutSeconds < 0) {
        outError = "Invalid config: http_timeout_seconds must not be negative.";
        return false;
    }
    cfg.downloadDir = expandPath(cfg.downloadDir);
    if (!cfg.logFile.empty()) cfg.logFile = expandPath(cfg.logFile);
    if (cfg.baseUrl.empty()) {
        cfg.baseUrl = deriveBaseUrl(cfg.manifestUrl);
    } else if (cfg.baseUrl.back() != '/') {
        cfg.baseUrl.push_back('/');
    }
    return true;
}

bool loadConfig(const std::string& path, const ConfigOverrides& overrides, Config& outCfg, std::string& outError) {
    auto parseFile = [&](const std::string& p, bool& found) -> bool {
        std::string contents;
        found = readWholeFile(p, contents);
        if (!found) return true;
        logDebug("Reading config " + p, "CFG");
        if (util::endsWith(util::toLower(p), ".json")) return parseJsonString(contents, outCfg, outError);
        return parseEnvString(contents, outCfg, outError);
    };

    bool found = false;
    if (!path.empty()) {
        if (!parseFile(path, found)) return false;
        if (!found) {
            outError = "Missing config: " + path;
            return false;
        }
    } else {
        if (!parseFile(kDefaultEnvPath, found)) return false;
        if (!found) {
            if (!parseFile(kDefaultJsonPath, found)) return false;
        }
        if (!found) logDebug("No config file found; using defaults", "CFG");
    }

    applyOverrides(overrides, outCfg);
    return finalizeConfig(outCfg, outError);
}

} // namespace tabsync

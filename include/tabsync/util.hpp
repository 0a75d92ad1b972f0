#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace tabsync::util {

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline void trim(std::string& s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
    s.erase(0, i);
}

inline bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Final segment of a '/'-separated path or URL ("a/b/c.parquet" -> "c.parquet").
inline std::string lastPathSegment(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos) return path;
    return path.substr(slash + 1);
}

inline std::string ellipsize(const std::string& s, size_t maxlen) {
    if (s.size() <= maxlen) return s;
    return s.substr(0, maxlen) + "...";
}

// Strict base-10 parse of a whole string; rejects trailing garbage.
inline bool parseInt(const std::string& in, int& out) {
    std::string s = in;
    trim(s);
    if (s.empty()) return false;
    size_t i = 0;
    bool neg = false;
    if (s[0] == '-' || s[0] == '+') {
        neg = s[0] == '-';
        i = 1;
    }
    if (i >= s.size()) return false;
    long long v = 0;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
        if (v > 2147483647LL) return false;
    }
    out = static_cast<int>(neg ? -v : v);
    return true;
}

inline bool parseBool(const std::string& in, bool& out) {
    std::string v = toLower(in);
    trim(v);
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        out = false;
        return true;
    }
    return false;
}

} // namespace tabsync::util

#include "tabsync/http_common.hpp"
#include "tabsync/util.hpp"
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

namespace tabsync {

bool sendAll(int fd, const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool parseHttpResponseHeaders(const std::string& headerBlock, ParsedHttpResponse& out, std::string& err) {
    out = ParsedHttpResponse{};
    auto firstCrLf = headerBlock.find("\r\n");
    std::string statusLine = headerBlock.substr(0, firstCrLf);
    if (!util::startsWith(statusLine, "HTTP/")) {
        err = "Malformed HTTP response (bad status line)";
        return false;
    }
    std::istringstream sl(statusLine);
    std::string httpVer;
    sl >> httpVer >> out.statusCode;
    if (!sl || out.statusCode < 100 || out.statusCode > 999) {
        err = "Malformed HTTP response (bad status code)";
        return false;
    }
    std::getline(sl, out.statusText);
    if (!out.statusText.empty() && out.statusText.front() == ' ') out.statusText.erase(out.statusText.begin());
    if (firstCrLf == std::string::npos) return true;

    std::istringstream hs(headerBlock.substr(firstCrLf + 2));
    std::string line;
    std::ostringstream raw;
    bool firstHeader = true;
    while (std::getline(hs, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        if (!firstHeader) raw << "\r\n";
        raw << line;
        firstHeader = false;
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string keyLower = util::toLower(line.substr(0, colon));
        std::string val = line.substr(colon + 1);
        util::trim(val);
        if (keyLower == "content-length") {
            out.contentLength = static_cast<uint64_t>(std::strtoull(val.c_str(), nullptr, 10));
            out.hasContentLength = true;
        } else if (keyLower == "transfer-encoding" && util::toLower(val).find("chunked") != std::string::npos) {
            out.chunked = true;
        } else if (keyLower == "location") {
            out.location = val;
        }
    }
    out.headersRaw = raw.str();
    return true;
}

} // namespace tabsync

#include "tabsync/http_client.hpp"
#include "tabsync/http_common.hpp"
#include "tabsync/logger.hpp"
#include "tabsync/raii.hpp"
#include "tabsync/util.hpp"
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <netdb.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>

namespace tabsync {

namespace {
constexpr size_t kRecvBuf = 8192;
constexpr int kMaxAttempts = 3;
constexpr int kMaxRedirects = 5;
constexpr std::chrono::milliseconds kRetryDelayFast{250};
constexpr std::chrono::milliseconds kRetryDelaySlow{1000};
}

bool parseHttpUrl(const std::string& url,
                  std::string& host,
                  std::string& portStr,
                  std::string& path,
                  std::string& err)
{
    if (url.rfind("http://", 0) != 0) {
        err = "Unsupported URL scheme (only http:// is handled here; TLS not implemented)";
        return false;
    }

    std::string rest = url.substr(7); // after "http://"
    std::string hostport;
    auto slash = rest.find('/');
    if (slash == std::string::npos) {
        hostport = rest;
        path = "/";
    } else {
        hostport = rest.substr(0, slash);
        path = rest.substr(slash); // includes '/'
    }

    host = hostport;
    portStr = "80";
    auto colon = hostport.find(':');
    if (colon != std::string::npos) {
        host = hostport.substr(0, colon);
        portStr = hostport.substr(colon + 1);
        if (portStr.empty()) portStr = "80";
    }

    if (host.empty()) {
        err = "Bad URL: missing host";
        return false;
    }
    if (path.empty()) path = "/";

    return true;
}

bool decodeChunkedBody(const std::string& body, std::string& decoded) {
    decoded.clear();
    size_t pos = 0;
    while (pos < body.size()) {
        size_t lineEnd = body.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            return false;
        }
        std::string lenLine = body.substr(pos, lineEnd - pos);
        // strip optional chunk extensions
        auto sc = lenLine.find(';');
        if (sc != std::string::npos) {
            lenLine = lenLine.substr(0, sc);
        }
        util::trim(lenLine);

        char* endptr = nullptr;
        errno = 0;
        long chunkSize = std::strtol(lenLine.c_str(), &endptr, 16);
        bool badNumber = (endptr == lenLine.c_str()) || (errno == ERANGE) || chunkSize < 0;
        if (badNumber) {
            return false;
        }
        if (chunkSize == 0) {
            // Require trailing CRLF after the zero-size chunk.
            if (lineEnd + 4 > body.size()) return false;
            if (body[lineEnd + 2] != '\r' || body[lineEnd + 3] != '\n') return false;
            return true;
        }
        pos = lineEnd + 2;
        if (pos + static_cast<size_t>(chunkSize) > body.size()) {
            return false;
        }
        decoded.append(body, pos, static_cast<size_t>(chunkSize));
        pos += static_cast<size_t>(chunkSize);
        if (pos + 2 > body.size()) return false;
        if (body[pos] != '\r' || body[pos + 1] != '\n') return false;
        pos += 2;
    }
    // Ran out of data before the terminating zero-size chunk.
    return false;
}

bool parseRawHttpResponse(const std::string& raw, HttpResponse& resp, std::string& err) {
    resp = HttpResponse{};
    if (raw.empty()) {
        err = "Empty HTTP response";
        return false;
    }
    auto hdrEnd = raw.find("\r\n\r\n");
    if (hdrEnd == std::string::npos) {
        err = "Malformed HTTP response (no header/body separator)";
        return false;
    }
    ParsedHttpResponse parsed;
    if (!parseHttpResponseHeaders(raw.substr(0, hdrEnd), parsed, err)) {
        return false;
    }
    resp.statusCode = parsed.statusCode;
    resp.statusText = parsed.statusText;
    resp.headersRaw = parsed.headersRaw;
    resp.location = parsed.location;

    std::string body = raw.substr(hdrEnd + 4);
    if (parsed.chunked) {
        std::string decoded;
        if (!decodeChunkedBody(body, decoded)) {
            err = "Malformed chunked HTTP body";
            return false;
        }
        resp.body.swap(decoded);
        return true;
    }
    if (parsed.hasContentLength) {
        if (body.size() < parsed.contentLength) {
            err = "Short read: got " + std::to_string(body.size()) + " of " +
                  std::to_string(parsed.contentLength) + " bytes";
            return false;
        }
        body.resize(static_cast<size_t>(parsed.contentLength));
    }
    resp.body.swap(body);
    return true;
}

std::string resolveRedirect(const std::string& requestUrl, const std::string& location) {
    if (location.find("://") != std::string::npos) return location;
    auto schemeEnd = requestUrl.find("://");
    if (schemeEnd == std::string::npos) return location;
    auto pathStart = requestUrl.find('/', schemeEnd + 3);
    std::string origin = pathStart == std::string::npos ? requestUrl : requestUrl.substr(0, pathStart);
    if (!location.empty() && location[0] == '/') return origin + location;
    std::string dir = pathStart == std::string::npos ? origin + "/" : requestUrl.substr(0, requestUrl.find_last_of('/') + 1);
    return dir + location;
}

bool httpRequest(const std::string& method,
                 const std::string& url,
                 const std::vector<std::pair<std::string, std::string>>& extraHeaders,
                 int timeoutSec,
                 HttpResponse& resp,
                 std::string& err)
{
    resp = HttpResponse{};
    std::string host, portStr, path;
    if (!parseHttpUrl(url, host, portStr, path, err)) {
        return false;
    }

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;

    int ret = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
    if (ret != 0 || !res) {
        err = "DNS lookup failed for host: " + host;
        if (res) freeaddrinfo(res);
        return false;
    }
    auto freeRes = make_scope_guard([&res]() { freeaddrinfo(res); });

    UniqueFd sockFd(socket(res->ai_family, res->ai_socktype, res->ai_protocol));
    if (!sockFd) {
        err = "Socket creation failed";
        return false;
    }

    if (timeoutSec > 0) {
        timeval tv{};
        tv.tv_sec  = timeoutSec;
        tv.tv_usec = 0;
        setsockopt(sockFd.fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sockFd.fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    if (connect(sockFd.fd, res->ai_addr, res->ai_addrlen) != 0) {
        err = "Connect failed to " + host + ":" + portStr;
        return false;
    }

    std::ostringstream req;
    req << method << " " << path << " HTTP/1.1\r\n";
    req << "Host: " << host << "\r\n";
    req << "Connection: close\r\n";
    req << "Accept-Encoding: identity\r\n";
    for (const auto& kv : extraHeaders) {
        req << kv.first << ": " << kv.second << "\r\n";
    }
    req << "\r\n";
    std::string reqStr = req.str();
    if (!sendAll(sockFd.fd, reqStr.data(), reqStr.size())) {
        err = "Send failed";
        return false;
    }

    std::string raw;
    char buf[kRecvBuf];
    while (true) {
        ssize_t n = recv(sockFd.fd, buf, sizeof(buf), 0);
        if (n > 0) {
            raw.append(buf, buf + n);
        } else if (n == 0) {
            break; // EOF
        } else {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                err = "Recv timed out";
            } else {
                err = "Recv failed";
            }
            return false;
        }
    }

    return parseRawHttpResponse(raw, resp, err);
}

bool httpGet(const std::string& url, int timeoutSec, HttpResponse& resp, std::string& err) {
    std::string current = url;
    std::vector<std::pair<std::string, std::string>> headers;
    headers.emplace_back("Accept", "application/json");

    for (int hop = 0; hop <= kMaxRedirects; ++hop) {
        std::string lastErr;
        bool got = false;
        for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
            HttpResponse r;
            std::string e;
            if (httpRequest("GET", current, headers, timeoutSec, r, e)) {
                resp = std::move(r);
                got = true;
                break;
            }
            lastErr = e.empty() ? "HTTP transport failure" : e;
            // Scheme/URL errors will not improve with retries.
            if (lastErr.find("URL") != std::string::npos) break;
            if (attempt < kMaxAttempts) {
                logDebug("GET " + current + " failed (" + lastErr + "), retrying", "HTTP");
                std::this_thread::sleep_for(attempt == 1 ? kRetryDelayFast : kRetryDelaySlow);
            }
        }
        if (!got) {
            err = "HTTP request failed after retries: " + lastErr;
            return false;
        }

        if (resp.statusCode >= 300 && resp.statusCode < 400 && !resp.location.empty()) {
            current = resolveRedirect(current, resp.location);
            logDebug("Following redirect to " + current, "HTTP");
            continue;
        }
        if (resp.statusCode >= 200 && resp.statusCode < 300) {
            return true;
        }
        err = "HTTP " + std::to_string(resp.statusCode) +
              (resp.statusText.empty() ? "" : (" " + resp.statusText));
        if (!resp.body.empty()) {
            err += " body: " + util::ellipsize(resp.body, 256);
        }
        return false;
    }
    err = "HTTP request failed: too many redirects";
    return false;
}

} // namespace tabsync

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace tabsync {

struct HttpResponse {
    int         statusCode   = 0;
    std::string statusText;
    std::string headersRaw;
    std::string location;
    std::string body;
};

// Split "http://host[:port]/path" (http only; TLS not implemented).
bool parseHttpUrl(const std::string& url,
                  std::string& host,
                  std::string& portStr,
                  std::string& path,
                  std::string& err);

bool decodeChunkedBody(const std::string& body, std::string& decoded);

// Parse a complete raw response (status line, headers, body). Decodes chunked
// bodies and rejects a body shorter than its Content-Length.
bool parseRawHttpResponse(const std::string& raw, HttpResponse& resp, std::string& err);

// Resolve a Location header against the URL that produced it.
std::string resolveRedirect(const std::string& requestUrl, const std::string& location);

// Single request over a fresh connection. Returns true if any HTTP response
// arrived (even 4xx/5xx).
bool httpRequest(const std::string& method,
                 const std::string& url,
                 const std::vector<std::pair<std::string, std::string>>& extraHeaders,
                 int timeoutSec,
                 HttpResponse& resp,
                 std::string& err);

// GET with up to 3 attempts on transport errors and up to 5 redirects.
// Non-2xx final status is an error and is not retried.
bool httpGet(const std::string& url, int timeoutSec, HttpResponse& resp, std::string& err);

} // namespace tabsync

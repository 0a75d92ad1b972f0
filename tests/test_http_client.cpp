#define CATCH_CONFIG_MAIN
#include "catch.hpp"
#include "tabsync/http_client.hpp"
#include "tabsync/http_common.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

// Loopback server that answers one connection per canned response, in order.
class CannedServer {
public:
    explicit CannedServer(std::vector<std::string> responses) : responses_(std::move(responses)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd_, 4);
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this]() { serve(); });
    }
    ~CannedServer() {
        thread_.join();
        ::close(fd_);
    }

    std::string url(const std::string& path) const { return "http://127.0.0.1:" + std::to_string(port_) + path; }
    const std::vector<std::string>& requests() const { return requests_; }

private:
    void serve() {
        for (const auto& response : responses_) {
            int client = ::accept(fd_, nullptr, nullptr);
            if (client < 0) return;
            std::string request;
            char buf[1024];
            while (request.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = ::recv(client, buf, sizeof(buf), 0);
                if (n <= 0) break;
                request.append(buf, static_cast<size_t>(n));
            }
            requests_.push_back(request);
            tabsync::sendAll(client, response.data(), response.size());
            ::close(client);
        }
    }

    std::vector<std::string> responses_;
    std::vector<std::string> requests_;
    int fd_{-1};
    uint16_t port_{0};
    std::thread thread_;
};

} // namespace

TEST_CASE("parseHttpUrl basic http") {
    std::string host, port, path, err;
    bool ok = tabsync::parseHttpUrl("http://example.com:8080/path?x=1", host, port, path, err);
    REQUIRE(ok);
    REQUIRE(host == "example.com");
    REQUIRE(port == "8080");
    REQUIRE(path == "/path?x=1");
}

TEST_CASE("parseHttpUrl defaults port and path") {
    std::string host, port, path, err;
    REQUIRE(tabsync::parseHttpUrl("http://export.local", host, port, path, err));
    REQUIRE(host == "export.local");
    REQUIRE(port == "80");
    REQUIRE(path == "/");
}

TEST_CASE("parseHttpUrl rejects https and missing host") {
    std::string host, port, path, err;
    REQUIRE_FALSE(tabsync::parseHttpUrl("https://export.local/manifest.json", host, port, path, err));
    REQUIRE(err.find("Unsupported URL scheme") != std::string::npos);
    err.clear();
    REQUIRE_FALSE(tabsync::parseHttpUrl("http:///manifest.json", host, port, path, err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("decodeChunkedBody valid") {
    std::string decoded;
    REQUIRE(tabsync::decodeChunkedBody("4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n", decoded));
    REQUIRE(decoded == "Wikipedia");
}

TEST_CASE("decodeChunkedBody valid uppercase hex and extensions") {
    std::string decoded;
    REQUIRE(tabsync::decodeChunkedBody("A;ext=1\r\n0123456789\r\n0\r\n\r\n", decoded));
    REQUIRE(decoded == "0123456789");
}

TEST_CASE("decodeChunkedBody rejects malformed input") {
    std::string decoded;
    REQUIRE_FALSE(tabsync::decodeChunkedBody("4\r\nWiki\r\nZ\r\nbad\r\n0\r\n\r\n", decoded));
    REQUIRE_FALSE(tabsync::decodeChunkedBody("1\r\na\r\n0\r\n", decoded));
    REQUIRE_FALSE(tabsync::decodeChunkedBody("4\r\nWiki\r\n", decoded));
}

TEST_CASE("parseRawHttpResponse honours Content-Length") {
    tabsync::HttpResponse resp;
    std::string err;
    REQUIRE(tabsync::parseRawHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello world", resp, err));
    REQUIRE(resp.statusCode == 200);
    REQUIRE(resp.body == "hello");

    REQUIRE_FALSE(tabsync::parseRawHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort", resp, err));
    REQUIRE(err.find("Short read") != std::string::npos);
}

TEST_CASE("parseRawHttpResponse decodes chunked bodies and keeps Location") {
    tabsync::HttpResponse resp;
    std::string err;
    REQUIRE(tabsync::parseRawHttpResponse(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\n{}\n\r\n0\r\n\r\n", resp, err));
    REQUIRE(resp.body == "{}\n");

    REQUIRE(tabsync::parseRawHttpResponse("HTTP/1.1 302 Found\r\nLocation: /v2/manifest.json\r\n\r\n", resp, err));
    REQUIRE(resp.statusCode == 302);
    REQUIRE(resp.location == "/v2/manifest.json");
}

TEST_CASE("parseHttpResponseHeaders rejects a bad status line") {
    tabsync::ParsedHttpResponse parsed;
    std::string err;
    REQUIRE_FALSE(tabsync::parseHttpResponseHeaders("SPDY nonsense", parsed, err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("resolveRedirect handles absolute and relative locations") {
    REQUIRE(tabsync::resolveRedirect("http://a/x/m.json", "http://b/y.json") == "http://b/y.json");
    REQUIRE(tabsync::resolveRedirect("http://a/x/m.json", "/z.json") == "http://a/z.json");
    REQUIRE(tabsync::resolveRedirect("http://a/x/m.json", "n.json") == "http://a/x/n.json");
    REQUIRE(tabsync::resolveRedirect("http://a", "n.json") == "http://a/n.json");
}

TEST_CASE("httpGet follows a redirect on loopback") {
    CannedServer server({
        "HTTP/1.1 301 Moved\r\nLocation: /real.json\r\nContent-Length: 0\r\n\r\n",
        "HTTP/1.1 200 OK\r\nContent-Length: 13\r\n\r\n{\"files\": {}}",
    });
    tabsync::HttpResponse resp;
    std::string err;
    REQUIRE(tabsync::httpGet(server.url("/manifest.json"), 5, resp, err));
    REQUIRE(resp.statusCode == 200);
    REQUIRE(resp.body == "{\"files\": {}}");
}

TEST_CASE("httpGet reports HTTP errors without retrying") {
    CannedServer server({"HTTP/1.1 404 Not Found\r\nContent-Length: 4\r\n\r\nnope"});
    tabsync::HttpResponse resp;
    std::string err;
    REQUIRE_FALSE(tabsync::httpGet(server.url("/missing.json"), 5, resp, err));
    REQUIRE(err.find("HTTP 404") != std::string::npos);
}

#include "egress/Gateway.h"
#include "egress/common/Logger.h"
#include "egress/fetch/FetchError.h"
#include "egress/transport/Compression.h"
#include "egress/transport/HttpTransport.h"

#include <arpa/inet.h>
#include <dirent.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using egress::FetchError;
using egress::TransportRequest;
using egress::TransportResponse;
using egress::common::Logger;
using egress::fetch::CancellationToken;
using egress::fetch::CancelReason;
using egress::transport::Compression;
using egress::transport::HttpTransport;

static uint16_t bindEphemeralPort(int* listenFdOut) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    assert(::listen(fd, 16) == 0);

    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    uint16_t port = ntohs(addr.sin_port);
    assert(port != 0);
    *listenFdOut = fd;
    return port;
}

static bool pollReadable(int fd, int timeoutMs) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    return ::poll(&pfd, 1, timeoutMs) == 1;
}

// Reads the request head plus a Content-Length body.
static std::string recvRequest(int fd) {
    std::string data;
    char buf[4096];
    size_t need = std::string::npos;
    while (data.size() < need) {
        if (!pollReadable(fd, 3000)) break;
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        data.append(buf, static_cast<size_t>(n));
        const size_t end = data.find("\r\n\r\n");
        if (end != std::string::npos && need == std::string::npos) {
            size_t bodyLen = 0;
            const size_t cl = data.find("Content-Length: ");
            if (cl != std::string::npos && cl < end) bodyLen = std::stoul(data.substr(cl + 16));
            need = end + 4 + bodyLen;
        }
    }
    return data;
}

static void sendAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n <= 0) return;
        off += static_cast<size_t>(n);
    }
}

static int openFdCount() {
    DIR* dir = ::opendir("/proc/self/fd");
    assert(dir != nullptr);
    int n = 0;
    while (::readdir(dir) != nullptr) ++n;
    ::closedir(dir);
    return n;
}

static void expectOversized(const TransportRequest& req) {
    try {
        HttpTransport transport;
        transport(req, std::make_shared<CancellationToken>());
        assert(false && "body over the cap should fail");
    } catch (const FetchError& e) {
        assert(e.kind() == FetchError::Kind::kContentLengthExceeded);
    }
}

// Accepts one connection, records the request and answers with `response`.
// An empty response holds the connection until the client hangs up.
class OneShotServer {
public:
    explicit OneShotServer(std::string response) : response_(std::move(response)) {
        port_ = bindEphemeralPort(&listenFd_);
        thread_ = std::thread([this]() { Serve(); });
    }

    ~OneShotServer() {
        if (thread_.joinable()) thread_.join();
        ::close(listenFd_);
    }

    uint16_t port() const { return port_; }

    const std::string& request() {
        if (thread_.joinable()) thread_.join();
        return request_;
    }

private:
    void Serve() {
        if (!pollReadable(listenFd_, 5000)) return;
        int fd = ::accept(listenFd_, nullptr, nullptr);
        if (fd < 0) return;
        request_ = recvRequest(fd);
        if (response_.empty()) {
            char buf[256];
            while (pollReadable(fd, 5000) && ::recv(fd, buf, sizeof(buf), 0) > 0) {
            }
        } else {
            sendAll(fd, response_);
        }
        ::close(fd);
    }

    std::string response_;
    int listenFd_{-1};
    uint16_t port_{0};
    std::string request_;
    std::thread thread_;
};

static TransportRequest loopbackRequest(uint16_t port, const std::string& target = "/") {
    TransportRequest req;
    req.scheme = "http";
    req.host = "svc.test";
    req.port = port;
    req.target = target;
    req.url = "http://svc.test:" + std::to_string(port) + target;
    req.addresses = {"127.0.0.1"};
    req.method = "GET";
    return req;
}

static void testContentLengthResponse() {
    OneShotServer server("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 5\r\nX-Echo: yes\r\n\r\nhello");
    HttpTransport transport;
    assert(transport.options().userAgent == "egress/1.0");
    TransportRequest req = loopbackRequest(server.port(), "/path?q=1");
    req.method = "POST";
    req.body = "payload";
    req.headers = {{"X-Custom", "1"}, {"Connection", "keep-alive"}};
    req.referrer = "https://ref.test/page";

    TransportResponse resp = transport(req, std::make_shared<CancellationToken>());
    assert(resp.status == 200);
    assert(resp.statusText == "OK");
    assert(resp.body == "hello");
    assert(resp.type == "basic");
    assert(!resp.redirected);
    assert(resp.headers.at("x-echo") == "yes");

    const std::string& wire = server.request();
    assert(wire.compare(0, 27, "POST /path?q=1 HTTP/1.1\r\nHo") == 0);
    assert(wire.find("Host: svc.test:" + std::to_string(server.port()) + "\r\n") != std::string::npos);
    assert(wire.find("X-Custom: 1\r\n") != std::string::npos);
    assert(wire.find("keep-alive") == std::string::npos);
    assert(wire.find("Connection: close\r\n") != std::string::npos);
    assert(wire.find("User-Agent: egress/1.0\r\n") != std::string::npos);
    assert(wire.find("Referer: https://ref.test/page\r\n") != std::string::npos);
    assert(wire.find("Content-Length: 7\r\n") != std::string::npos);
    assert(wire.substr(wire.size() - 7) == "payload");
}

static void testChunkedResponse() {
    OneShotServer server("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nabcd\r\n3\r\nefg\r\n0\r\n\r\n");
    HttpTransport transport;
    TransportResponse resp = transport(loopbackRequest(server.port()), std::make_shared<CancellationToken>());
    assert(resp.body == "abcdefg");
}

static void testGzipResponse() {
    std::string gz;
    assert(Compression::Compress(Compression::Encoding::kGzip, "compressed payload", &gz));
    OneShotServer server("HTTP/1.1 200 OK\r\nContent-Encoding: gzip\r\nContent-Length: " + std::to_string(gz.size()) +
                         "\r\n\r\n" + gz);
    HttpTransport transport;
    TransportResponse resp = transport(loopbackRequest(server.port()), std::make_shared<CancellationToken>());
    assert(resp.body == "compressed payload");
    assert(server.request().find("Accept-Encoding: gzip, deflate\r\n") != std::string::npos);
}

static void testContentLengthCap() {
    OneShotServer server("HTTP/1.1 200 OK\r\nContent-Length: 500\r\n\r\n" + std::string(500, 'x'));
    HttpTransport transport;
    TransportRequest req = loopbackRequest(server.port());
    req.maxContentLength = 100;
    try {
        transport(req, std::make_shared<CancellationToken>());
        assert(false && "body over the cap should fail");
    } catch (const FetchError& e) {
        assert(e.kind() == FetchError::Kind::kContentLengthExceeded);
    }
}

static void testDeflateOverCap() {
    std::string z;
    assert(Compression::Compress(Compression::Encoding::kDeflate, std::string(4096, 'a'), &z));
    assert(z.size() < 100);
    OneShotServer server("HTTP/1.1 200 OK\r\nContent-Encoding: deflate\r\nContent-Length: " + std::to_string(z.size()) +
                         "\r\n\r\n" + z);
    TransportRequest req = loopbackRequest(server.port());
    req.maxContentLength = 100;
    expectOversized(req);
}

static void testZeroCap() {
    {
        OneShotServer server("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n1\r\nx\r\n0\r\n\r\n");
        TransportRequest req = loopbackRequest(server.port());
        req.maxContentLength = 0;
        expectOversized(req);
    }
    {
        OneShotServer server("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
        TransportRequest req = loopbackRequest(server.port());
        req.maxContentLength = 0;
        HttpTransport transport;
        assert(transport(req, std::make_shared<CancellationToken>()).body.empty());
    }
}

static void testRedirectRefused() {
    OneShotServer server("HTTP/1.1 302 Found\r\nLocation: http://elsewhere.test/\r\nContent-Length: 0\r\n\r\n");
    HttpTransport transport;
    TransportRequest req = loopbackRequest(server.port());
    req.redirect = "error";
    bool threw = false;
    try {
        transport(req, std::make_shared<CancellationToken>());
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("redirect") != std::string::npos;
    }
    assert(threw);
}

static void testManualRedirectReturned() {
    OneShotServer server("HTTP/1.1 301 Moved\r\nLocation: /next\r\nContent-Length: 0\r\n\r\n");
    HttpTransport transport;
    TransportRequest req = loopbackRequest(server.port());
    req.redirect = "manual";
    TransportResponse resp = transport(req, std::make_shared<CancellationToken>());
    assert(resp.status == 301);
    assert(resp.headers.at("location") == "/next");
}

static void testCancelAborts() {
    OneShotServer server("");
    HttpTransport transport;
    auto token = std::make_shared<CancellationToken>();
    std::thread canceller([token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token->Cancel(CancelReason::kTimeout);
    });

    const auto start = std::chrono::steady_clock::now();
    bool threw = false;
    try {
        transport(loopbackRequest(server.port()), token);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    canceller.join();
    assert(threw);
    assert(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(2000));
}

static void testConnectFailure() {
    int fd = -1;
    const uint16_t port = bindEphemeralPort(&fd);
    ::close(fd);
    HttpTransport transport;
    const int before = openFdCount();
    bool threw = false;
    try {
        TransportRequest req = loopbackRequest(port);
        req.addresses = {"127.0.0.1", "not-an-ip", "127.0.0.1"};
        transport(req, std::make_shared<CancellationToken>());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    // Every socket opened for a failed attempt is closed again.
    assert(openFdCount() == before);
}

// Full path through the gateway with the default transport.
static void testGatewayEndToEnd() {
    OneShotServer server("HTTP/1.1 201 Created\r\nContent-Type: application/json\r\nContent-Length: 11\r\n\r\n{\"id\":\"42\"}");
    egress::GatewayOptions o;
    o.allowDirectIp = true;
    o.http.userAgent = "egress-test";
    egress::Gateway gw(o);

    egress::FetchResult r = gw.Fetch("http://127.0.0.1:" + std::to_string(server.port()) + "/items");
    assert(r.status == 201);
    assert(r.ok);
    assert(r.bodyType == egress::BodyType::kJson);
    assert(std::get<Json::Value>(r.body)["id"].asString() == "42");
    assert(server.request().find("User-Agent: egress-test\r\n") != std::string::npos);
}

int main() {
    Logger::Instance().SetLevel(egress::common::LogLevel::ERROR);
    testContentLengthResponse();
    testChunkedResponse();
    testGzipResponse();
    testContentLengthCap();
    testDeflateOverCap();
    testZeroCap();
    testRedirectRefused();
    testManualRedirectReturned();
    testCancelAborts();
    testConnectFailure();
    testGatewayEndToEnd();
    return 0;
}

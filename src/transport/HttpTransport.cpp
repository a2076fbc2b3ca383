#include "egress/transport/HttpTransport.h"
#include "egress/common/Logger.h"
#include "egress/common/noncopyable.h"
#include "egress/fetch/FetchError.h"
#include "egress/transport/Compression.h"
#include "egress/transport/HttpResponseParser.h"
#include "egress/transport/TlsClientContext.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace egress {
namespace transport {

namespace {

using Millis = std::chrono::milliseconds;

constexpr int kPollSliceMs = 50;

enum class WaitResult { kReady, kTimeout, kCancelled };

std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

bool IsIpv4(const std::string& s) {
    in_addr a;
    return ::inet_pton(AF_INET, s.c_str(), &a) == 1;
}

bool IsIpv6(const std::string& s) {
    in6_addr a;
    return ::inet_pton(AF_INET6, s.c_str(), &a) == 1;
}

std::string OpenSslError() {
    const unsigned long e = ERR_get_error();
    if (e == 0) return "unknown error";
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

// Polls in short slices so a cancelled token is noticed promptly.
WaitResult WaitFd(int fd, short events, Millis timeout, const fetch::CancellationTokenPtr& token) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (token && token->cancelled()) return WaitResult::kCancelled;
        const auto left = std::chrono::duration_cast<Millis>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return WaitResult::kTimeout;
        pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;
        const int rc = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(left.count(), kPollSliceMs)));
        if (rc > 0) return WaitResult::kReady;
        if (rc < 0 && errno != EINTR) {
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
        }
    }
}

[[noreturn]] void ThrowAborted(const fetch::CancellationTokenPtr& token) {
    throw std::runtime_error(std::string("request aborted: ") + fetch::CancelReasonName(token->reason()));
}

void Await(int fd, short events, Millis timeout, const fetch::CancellationTokenPtr& token, const char* what) {
    switch (WaitFd(fd, events, timeout, token)) {
        case WaitResult::kReady:
            return;
        case WaitResult::kCancelled:
            ThrowAborted(token);
        case WaitResult::kTimeout:
            throw std::runtime_error(std::string(what) + " timed out");
    }
}

bool ToSockaddr(const std::string& ip, uint16_t port, sockaddr_storage* ss, socklen_t* len) {
    std::memset(ss, 0, sizeof(*ss));
    auto* v4 = reinterpret_cast<sockaddr_in*>(ss);
    if (::inet_pton(AF_INET, ip.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(port);
        *len = sizeof(sockaddr_in);
        return true;
    }
    auto* v6 = reinterpret_cast<sockaddr_in6*>(ss);
    if (::inet_pton(AF_INET6, ip.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(port);
        *len = sizeof(sockaddr_in6);
        return true;
    }
    return false;
}

// One client connection, optionally wrapped in TLS.
class Connection : common::noncopyable {
public:
    Connection(const HttpTransport::Options& opts, const fetch::CancellationTokenPtr& token)
        : opts_(opts), token_(token) {}

    ~Connection() {
        if (ssl_) SSL_free(ssl_);
        if (fd_ >= 0) ::close(fd_);
    }

    void Connect(const std::vector<std::string>& addresses, uint16_t port) {
        std::string lastError = "no addresses";
        for (const auto& ip : addresses) {
            sockaddr_storage ss;
            socklen_t len = 0;
            if (!ToSockaddr(ip, port, &ss, &len)) {
                lastError = "invalid address " + ip;
                continue;
            }
            const int fd = ::socket(ss.ss_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
            if (fd < 0) {
                lastError = std::string("socket: ") + std::strerror(errno);
                continue;
            }
            // Owned from here on: the destructor closes it if a wait throws.
            fd_ = fd;
            if (::connect(fd, reinterpret_cast<sockaddr*>(&ss), len) != 0 && errno != EINPROGRESS) {
                lastError = ip + ": " + std::strerror(errno);
                CloseSocket();
                continue;
            }
            const WaitResult w = WaitFd(fd, POLLOUT, opts_.connectTimeout, token_);
            if (w == WaitResult::kCancelled) {
                CloseSocket();
                ThrowAborted(token_);
            }
            if (w == WaitResult::kTimeout) {
                lastError = ip + ": connect timed out";
                CloseSocket();
                continue;
            }
            int soerr = 0;
            socklen_t sl = sizeof(soerr);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soerr, &sl) != 0 || soerr != 0) {
                lastError = ip + ": " + std::strerror(soerr ? soerr : errno);
                CloseSocket();
                continue;
            }
            LOG_DEBUG << "connected to " << ip << ":" << port;
            return;
        }
        throw std::runtime_error("connect failed: " + lastError);
    }

    void StartTls(const TlsClientContext& tls, const std::string& host) {
        ssl_ = SSL_new(reinterpret_cast<SSL_CTX*>(tls.ctx()));
        if (!ssl_) throw std::runtime_error("TLS: SSL_new failed: " + OpenSslError());
        SSL_set_fd(ssl_, fd_);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
        SSL_set_options(ssl_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
        const bool ipHost = IsIpv4(host) || IsIpv6(host);
        if (!ipHost) SSL_set_tlsext_host_name(ssl_, host.c_str());
        if (tls.verifyPeer()) {
            const int rc = ipHost ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl_), host.c_str())
                                  : SSL_set1_host(ssl_, host.c_str());
            if (rc != 1) throw std::runtime_error("TLS: cannot set expected peer name " + host);
        }

        while (true) {
            ERR_clear_error();
            const int rc = SSL_connect(ssl_);
            if (rc == 1) break;
            const int err = SSL_get_error(ssl_, rc);
            if (err == SSL_ERROR_WANT_READ) {
                Await(fd_, POLLIN, opts_.ioTimeout, token_, "TLS handshake");
            } else if (err == SSL_ERROR_WANT_WRITE) {
                Await(fd_, POLLOUT, opts_.ioTimeout, token_, "TLS handshake");
            } else {
                const long verify = SSL_get_verify_result(ssl_);
                if (verify != X509_V_OK) {
                    throw std::runtime_error(std::string("TLS: certificate verification failed: ") +
                                             X509_verify_cert_error_string(verify));
                }
                throw std::runtime_error("TLS handshake failed: " + OpenSslError());
            }
        }
        LOG_DEBUG << "TLS established with " << host << " (" << SSL_get_version(ssl_) << ")";
    }

    void SendAll(const std::string& data) {
        size_t off = 0;
        while (off < data.size()) {
            if (token_ && token_->cancelled()) ThrowAborted(token_);
            const size_t left = data.size() - off;
            if (ssl_) {
                ERR_clear_error();
                const int n = SSL_write(ssl_, data.data() + off, static_cast<int>(std::min<size_t>(left, 1 << 20)));
                if (n > 0) {
                    off += static_cast<size_t>(n);
                    continue;
                }
                const int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_WANT_WRITE) Await(fd_, POLLOUT, opts_.ioTimeout, token_, "send");
                else if (err == SSL_ERROR_WANT_READ) Await(fd_, POLLIN, opts_.ioTimeout, token_, "send");
                else throw std::runtime_error("TLS write failed: " + OpenSslError());
                continue;
            }
            const ssize_t n = ::send(fd_, data.data() + off, left, MSG_NOSIGNAL);
            if (n > 0) {
                off += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                Await(fd_, POLLOUT, opts_.ioTimeout, token_, "send");
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            throw std::runtime_error(std::string("send failed: ") + std::strerror(errno));
        }
    }

    // Returns 0 once the peer closed the connection.
    size_t Read(char* buf, size_t cap) {
        while (true) {
            if (token_ && token_->cancelled()) ThrowAborted(token_);
            if (ssl_) {
                ERR_clear_error();
                const int n = SSL_read(ssl_, buf, static_cast<int>(cap));
                if (n > 0) return static_cast<size_t>(n);
                const int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ) {
                    Await(fd_, POLLIN, opts_.ioTimeout, token_, "receive");
                } else if (err == SSL_ERROR_WANT_WRITE) {
                    Await(fd_, POLLOUT, opts_.ioTimeout, token_, "receive");
                } else if (err == SSL_ERROR_SYSCALL && errno == 0) {
                    // EOF without close_notify; framing decides whether that is complete.
                    return 0;
                } else {
                    throw std::runtime_error("TLS read failed: " + OpenSslError());
                }
                continue;
            }
            const ssize_t n = ::recv(fd_, buf, cap, 0);
            if (n >= 0) return static_cast<size_t>(n);
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                Await(fd_, POLLIN, opts_.ioTimeout, token_, "receive");
                continue;
            }
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("recv failed: ") + std::strerror(errno));
        }
    }

private:
    void CloseSocket() {
        ::close(fd_);
        fd_ = -1;
    }

    const HttpTransport::Options& opts_;
    const fetch::CancellationTokenPtr& token_;
    int fd_{-1};
    SSL* ssl_{nullptr};
};

bool HasCrLf(const std::string& s) {
    return s.find_first_of("\r\n") != std::string::npos;
}

bool IsHopByHop(const std::string& lowerName) {
    static const char* const kNames[] = {
        "host", "content-length", "connection", "keep-alive", "transfer-encoding",
        "te", "upgrade", "proxy-connection", "trailer",
    };
    for (const char* n : kNames) {
        if (lowerName == n) return true;
    }
    return false;
}

std::string HostHeader(const TransportRequest& req) {
    std::string h = (req.host.find(':') != std::string::npos) ? "[" + req.host + "]" : req.host;
    const uint16_t defaultPort = (req.scheme == "https") ? 443 : 80;
    if (req.port != 0 && req.port != defaultPort) h += ":" + std::to_string(req.port);
    return h;
}

} // namespace

HttpTransport::HttpTransport(Options opts)
    : opts_(std::move(opts)), tls_(std::make_shared<TlsClientContext>()) {
    if (!tls_->InitClient(opts_.verifyPeer, opts_.caFile)) {
        LOG_ERROR << "HttpTransport: TLS client context unavailable, https requests will fail";
    }
}

std::string HttpTransport::BuildRequest(const TransportRequest& req, const std::string& userAgent) {
    const std::string method = req.method.empty() ? std::string("GET") : req.method;
    std::ostringstream oss;
    oss << method << " " << (req.target.empty() ? std::string("/") : req.target) << " HTTP/1.1\r\n";
    oss << "Host: " << HostHeader(req) << "\r\n";
    for (const auto& kv : req.headers) {
        if (kv.first.empty() || HasCrLf(kv.first) || HasCrLf(kv.second) ||
            kv.first.find(':') != std::string::npos) {
            throw std::runtime_error("invalid request header '" + kv.first + "'");
        }
        if (IsHopByHop(ToLowerCopy(kv.first))) continue;
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    if (!FindHeader(req.headers, "accept")) oss << "Accept: */*\r\n";
    if (!FindHeader(req.headers, "accept-encoding")) oss << "Accept-Encoding: gzip, deflate\r\n";
    if (!FindHeader(req.headers, "user-agent") && !userAgent.empty()) oss << "User-Agent: " << userAgent << "\r\n";
    if (!FindHeader(req.headers, "referer") && !req.referrer.empty() && req.referrerPolicy != "no-referrer" &&
        (req.referrer.compare(0, 7, "http://") == 0 || req.referrer.compare(0, 8, "https://") == 0) &&
        !HasCrLf(req.referrer)) {
        oss << "Referer: " << req.referrer << "\r\n";
    }
    if (!req.body.empty() || method == "POST" || method == "PUT" || method == "PATCH") {
        oss << "Content-Length: " << req.body.size() << "\r\n";
    }
    oss << "Connection: close\r\n\r\n";
    oss << req.body;
    return oss.str();
}

TransportResponse HttpTransport::operator()(const TransportRequest& req, const fetch::CancellationTokenPtr& token) const {
    if (req.scheme != "http" && req.scheme != "https") {
        throw std::runtime_error("unsupported scheme '" + req.scheme + "'");
    }
    const std::string wire = BuildRequest(req, opts_.userAgent);

    Connection conn(opts_, token);
    conn.Connect(req.addresses, req.port);
    if (req.scheme == "https") {
        if (!tls_->ok()) throw std::runtime_error("TLS client context unavailable");
        conn.StartTls(*tls_, req.host);
    }
    conn.SendAll(wire);

    std::optional<size_t> cap;
    if (req.maxContentLength) cap = static_cast<size_t>(*req.maxContentLength);
    HttpResponseParser parser(req.method == "HEAD");
    if (cap) parser.setBodyLimit(*cap);

    char buf[16384];
    bool lengthChecked = false;
    while (!parser.gotAll() && !parser.hasError()) {
        const size_t n = conn.Read(buf, sizeof(buf));
        if (n == 0) {
            parser.FinishOnClose();
            break;
        }
        parser.feed(buf, n);
        if (!lengthChecked && req.maxContentLength && parser.headersComplete()) {
            lengthChecked = true;
            if (parser.hasContentLength() && parser.contentLength() > *req.maxContentLength) {
                throw FetchError(FetchError::Kind::kContentLengthExceeded,
                                 "content-length " + std::to_string(parser.contentLength()) +
                                     " exceeds limit " + std::to_string(*req.maxContentLength));
            }
        }
    }
    if (parser.hasError()) {
        if (parser.bodyLimitExceeded()) {
            throw FetchError(FetchError::Kind::kContentLengthExceeded,
                             "response body exceeds limit " + std::to_string(*cap));
        }
        throw std::runtime_error("invalid HTTP response: " + parser.error());
    }

    TransportResponse resp;
    resp.url = req.url;
    resp.status = parser.statusCode();
    resp.statusText = parser.reasonPhrase();
    resp.redirected = false;
    resp.type = "basic";
    resp.headers = parser.headers();

    if (resp.status >= 300 && resp.status < 400 && req.redirect == "error") {
        if (const std::string* location = parser.header("location")) {
            throw std::runtime_error("redirect to '" + *location + "' refused");
        }
    }

    std::string raw = parser.TakeBody();
    const std::string* encoding = parser.header("content-encoding");
    if (encoding && !raw.empty()) {
        const Compression::Encoding enc = Compression::ParseContentEncoding(*encoding);
        if (enc == Compression::Encoding::kUnknown) {
            throw std::runtime_error("unsupported content-encoding '" + *encoding + "'");
        }
        if (enc != Compression::Encoding::kIdentity) {
            std::string decoded;
            if (!Compression::Decompress(enc, raw, &decoded, cap)) {
                if (cap && decoded.size() > *cap) {
                    throw FetchError(FetchError::Kind::kContentLengthExceeded,
                                     "decoded body exceeds limit " + std::to_string(*cap));
                }
                throw std::runtime_error(std::string("failed to decode ") + Compression::EncodingName(enc) + " body");
            }
            raw.swap(decoded);
        }
    }
    resp.body = std::move(raw);

    LOG_DEBUG << req.method << " " << req.url << " -> " << resp.status << " (" << resp.body.size() << " bytes)";
    return resp;
}

} // namespace transport
} // namespace egress

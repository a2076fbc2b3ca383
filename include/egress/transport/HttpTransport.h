#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "egress/fetch/FetchTypes.h"

namespace egress {
namespace transport {

class TlsClientContext;

// Default Transport: one HTTP/1.1 exchange per call on a fresh connection.
//
// Connects only to TransportRequest::addresses, never follows redirects, and
// aborts as soon as the cancellation token fires. TLS writes may raise SIGPIPE
// on a reset connection; hosts are expected to ignore that signal.
class HttpTransport {
public:
    struct Options {
        std::chrono::milliseconds connectTimeout{10000}; // per address
        std::chrono::milliseconds ioTimeout{30000};      // max idle time on the socket
        bool verifyPeer{true};
        std::string caFile;                              // empty = system trust store
        std::string userAgent{"egress/1.0"};
    };

    HttpTransport() : HttpTransport(Options()) {}
    explicit HttpTransport(Options opts);

    // Throws std::runtime_error on connection, TLS, protocol or decoding errors,
    // and FetchError(kContentLengthExceeded) when the body outgrows the cap.
    TransportResponse operator()(const TransportRequest& req, const fetch::CancellationTokenPtr& token) const;

    const Options& options() const { return opts_; }

    // Serialized request head and body.
    static std::string BuildRequest(const TransportRequest& req, const std::string& userAgent);

private:
    Options opts_;
    std::shared_ptr<TlsClientContext> tls_;
};

} // namespace transport
} // namespace egress

#pragma once

#include "egress/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace egress {
namespace transport {

class TlsClientContext : egress::common::noncopyable {
public:
    TlsClientContext();
    ~TlsClientContext();

    // TLS >= 1.2. With verifyPeer, certificates are checked against `caFile`, or
    // the system trust store when it is empty.
    bool InitClient(bool verifyPeer, const std::string& caFile);
    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }
    bool verifyPeer() const { return verifyPeer_; }

private:
    ssl_ctx_st* ctx_{nullptr};
    bool verifyPeer_{true};
};

} // namespace transport
} // namespace egress

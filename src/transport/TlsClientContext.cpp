#include "egress/transport/TlsClientContext.h"
#include "egress/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <atomic>

namespace egress {
namespace transport {

TlsClientContext::TlsClientContext() {
    static std::atomic<bool> inited{false};
    bool expected = false;
    if (inited.compare_exchange_strong(expected, true)) {
        SSL_library_init();
        SSL_load_error_strings();
        OpenSSL_add_ssl_algorithms();
    }
}

TlsClientContext::~TlsClientContext() {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }
}

bool TlsClientContext::InitClient(bool verifyPeer, const std::string& caFile) {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }

    SSL_CTX* c = SSL_CTX_new(TLS_client_method());
    if (!c) {
        LOG_ERROR << "TLS: SSL_CTX_new failed";
        return false;
    }

    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION);

    verifyPeer_ = verifyPeer;
    if (verifyPeer) {
        const int rc = caFile.empty() ? SSL_CTX_set_default_verify_paths(c)
                                      : SSL_CTX_load_verify_locations(c, caFile.c_str(), nullptr);
        if (rc != 1) {
            LOG_ERROR << "TLS: load trust store failed: " << (caFile.empty() ? "<system>" : caFile);
            SSL_CTX_free(c);
            return false;
        }
        SSL_CTX_set_verify(c, SSL_VERIFY_PEER, nullptr);
    } else {
        LOG_WARN << "TLS: peer verification disabled";
        SSL_CTX_set_verify(c, SSL_VERIFY_NONE, nullptr);
    }

    ctx_ = reinterpret_cast<ssl_ctx_st*>(c);
    return true;
}

} // namespace transport
} // namespace egress

#pragma once

#include <stdexcept>
#include <string>

#include "egress/fetch/CancellationToken.h"

namespace egress {

// Every failure surfaced by Gateway::Fetch.
class FetchError : public std::runtime_error {
public:
    enum class Kind {
        kDisposed,
        kAddressBlocked,
        kAdmissionLimit,
        kContentLengthExceeded,
        kTransportFailure,
        kInvalidArgument,
        kResponseFormat,
    };

    FetchError(Kind kind, const std::string& message,
               fetch::CancelReason reason = fetch::CancelReason::kNone)
        : std::runtime_error(message), kind_(kind), reason_(reason) {}

    Kind kind() const { return kind_; }

    // kTimeout / kDisposed when the transport was aborted through its token.
    fetch::CancelReason cancelReason() const { return reason_; }
    bool cancelled() const { return reason_ != fetch::CancelReason::kNone; }

    static const char* KindName(Kind kind);

private:
    Kind kind_;
    fetch::CancelReason reason_;
};

} // namespace egress

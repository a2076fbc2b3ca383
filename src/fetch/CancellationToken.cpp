#include "egress/fetch/CancellationToken.h"

namespace egress {
namespace fetch {

const char* CancelReasonName(CancelReason reason) {
    switch (reason) {
        case CancelReason::kNone: return "none";
        case CancelReason::kTimeout: return "timeout";
        case CancelReason::kDisposed: return "disposed";
    }
    return "unknown";
}

bool CancellationToken::Cancel(CancelReason reason) {
    if (reason == CancelReason::kNone) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reason_ != CancelReason::kNone) return false;
        reason_ = reason;
    }
    cond_.notify_all();
    return true;
}

bool CancellationToken::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_ != CancelReason::kNone;
}

CancelReason CancellationToken::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cond_.wait_for(lock, d, [this]() { return reason_ != CancelReason::kNone; });
}

} // namespace fetch
} // namespace egress

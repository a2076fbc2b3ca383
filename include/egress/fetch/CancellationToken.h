#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace egress {
namespace fetch {

enum class CancelReason {
    kNone,
    kTimeout,   // per-call timeout expired
    kDisposed,  // gateway disposed while the call was in flight
};

const char* CancelReasonName(CancelReason reason);

// One-shot cancellation signal shared between a request, its timeout timer and
// the gateway's disposal path. The first Cancel() wins and fixes the reason.
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Returns true if this call performed the cancellation.
    bool Cancel(CancelReason reason);

    bool cancelled() const;
    CancelReason reason() const;

    // Sleeps up to `d`, waking early on cancellation. Returns cancelled().
    bool WaitFor(std::chrono::milliseconds d) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cond_;
    CancelReason reason_{CancelReason::kNone};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace fetch
} // namespace egress

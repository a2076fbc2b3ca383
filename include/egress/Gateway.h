#pragma once

#include <string>

#include "egress/GatewayOptions.h"
#include "egress/admission/AdmissionController.h"
#include "egress/common/TimerQueue.h"
#include "egress/common/noncopyable.h"
#include "egress/fetch/FetchError.h"
#include "egress/fetch/FetchTypes.h"
#include "egress/fetch/Lifecycle.h"
#include "egress/fetch/RequestExecutor.h"
#include "egress/policy/AddressPolicy.h"

namespace egress {

// Outbound HTTP for untrusted code. Every destination is checked against the
// address policy before a socket is opened, and calls pass through rate,
// concurrency and wait-queue limits.
//
// Fetch() blocks the calling thread and may be called from many threads at
// once. Dispose() rejects queued callers, aborts in-flight requests and makes
// every later call fail with FetchError(kDisposed).
class Gateway : common::noncopyable {
public:
    // Throws std::invalid_argument on invalid limits, CIDRs or patterns.
    explicit Gateway(GatewayOptions options);

    // Disposes, then waits for in-flight calls to unwind.
    ~Gateway();

    // Throws FetchError.
    FetchResult Fetch(const std::string& url, const FetchParams& params = FetchParams());

    // Idempotent.
    void Dispose();
    bool disposed() const { return lifecycle_.disposed(); }

    admission::AdmissionController::Snapshot admissionSnapshot() const { return admission_.snapshot(); }
    std::size_t inFlight() const { return lifecycle_.inFlight(); }
    const policy::AddressPolicy& policy() const { return policy_; }

private:
    common::TimerQueue timers_;
    fetch::Lifecycle lifecycle_;
    policy::AddressPolicy policy_;
    admission::AdmissionController admission_;
    fetch::RequestExecutor executor_;
};

} // namespace egress

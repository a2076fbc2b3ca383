#include "egress/fetch/CancellationToken.h"

#include <cassert>
#include <chrono>
#include <cstring>
#include <thread>

using egress::fetch::CancellationToken;
using egress::fetch::CancelReason;
using egress::fetch::CancelReasonName;

static void testFirstCancelWins() {
    CancellationToken t;
    assert(!t.cancelled());
    assert(t.reason() == CancelReason::kNone);
    assert(!t.Cancel(CancelReason::kNone));
    assert(t.Cancel(CancelReason::kTimeout));
    assert(!t.Cancel(CancelReason::kDisposed));
    assert(t.cancelled());
    assert(t.reason() == CancelReason::kTimeout);
    assert(std::strcmp(CancelReasonName(t.reason()), "timeout") == 0);
}

static void testWaitFor() {
    CancellationToken t;
    const auto start = std::chrono::steady_clock::now();
    assert(!t.WaitFor(std::chrono::milliseconds(20)));
    assert(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(20));

    std::thread canceller([&t]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        t.Cancel(CancelReason::kDisposed);
    });
    const auto begin = std::chrono::steady_clock::now();
    assert(t.WaitFor(std::chrono::seconds(5)));
    assert(std::chrono::steady_clock::now() - begin < std::chrono::seconds(2));
    assert(t.reason() == CancelReason::kDisposed);
    canceller.join();
}

int main() {
    testFirstCancelWins();
    testWaitFor();
    return 0;
}

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <mutex>

#include "egress/common/TimerQueue.h"
#include "egress/common/noncopyable.h"

namespace egress {
namespace admission {

// Layered admission: a rate pool (rateQuota admissions per rateWindow), a cap on
// concurrently active calls, and a bounded FIFO queue of blocked callers.
//
// Acquire() blocks the calling thread until it is admitted. Only the head of the
// queue may be admitted; every admission, release, rejection and window reset
// wakes all waiters so the new head re-checks.
class AdmissionController : common::noncopyable {
public:
    struct Config {
        std::chrono::milliseconds rateWindow{0}; // 0 disables the rate pool
        int64_t rateQuota{0};
        int64_t maxActive{0};                    // 0 means unlimited
        int64_t maxAwaiting{0};                  // 0 rejects every caller that would block
    };

    struct Snapshot {
        int64_t active{0};
        int64_t awaiting{0};
        int64_t rateCount{0};
        uint64_t admitted{0};
        uint64_t rejected{0};
    };

    // Release handle for one admission. Move-only; releases on destruction.
    class Permit {
    public:
        Permit() = default;
        Permit(Permit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        ~Permit() { Release(); }

        void Release();
        bool valid() const { return owner_ != nullptr; }

    private:
        friend class AdmissionController;
        explicit Permit(AdmissionController* owner) : owner_(owner) {}

        AdmissionController* owner_{nullptr};
    };

    // Throws std::invalid_argument on negative limits or on a rate window
    // without a positive quota. `timers` must outlive the controller.
    AdmissionController(Config cfg, common::TimerQueue* timers);
    ~AdmissionController();

    // Throws FetchError(kDisposed) when disposed before or while waiting, and
    // FetchError(kAdmissionLimit) when the caller would block on a full queue.
    Permit Acquire();

    // Rejects every waiter, cancels the window timer. Idempotent.
    void Dispose();
    bool disposed() const;

    // Blocks until no call is active or waiting.
    void WaitIdle();

    Snapshot snapshot() const;
    const Config& config() const { return cfg_; }

private:
    struct Waiter {
        uint64_t seq;
        bool rejected;
    };

    bool rateLimitedLocked() const;
    bool activeLimitedLocked() const;
    void AdmitLocked();
    void ReleaseOne();
    void OnWindowExpired(uint64_t generation);

    const Config cfg_;
    common::TimerQueue* timers_;

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::list<Waiter> waiters_;
    uint64_t nextSeq_{1};
    int64_t active_{0};
    int64_t rateCount_{0};
    common::TimerQueue::TimerId windowTimer_{0};
    uint64_t windowGeneration_{0};
    uint64_t admitted_{0};
    uint64_t rejected_{0};
    bool disposed_{false};
};

} // namespace admission
} // namespace egress

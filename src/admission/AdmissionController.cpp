#include "egress/admission/AdmissionController.h"
#include "egress/common/Logger.h"
#include "egress/fetch/FetchError.h"

#include <stdexcept>

namespace egress {
namespace admission {

AdmissionController::Permit& AdmissionController::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        Release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

void AdmissionController::Permit::Release() {
    if (owner_) {
        AdmissionController* owner = owner_;
        owner_ = nullptr;
        owner->ReleaseOne();
    }
}

AdmissionController::AdmissionController(Config cfg, common::TimerQueue* timers)
    : cfg_(cfg), timers_(timers) {
    if (cfg_.rateWindow.count() < 0) {
        throw std::invalid_argument("AdmissionController rateWindow must be >= 0");
    }
    if (cfg_.rateWindow.count() > 0 && cfg_.rateQuota <= 0) {
        throw std::invalid_argument("AdmissionController rateQuota must be > 0 when rateWindow is set");
    }
    if (cfg_.rateQuota < 0 || cfg_.maxActive < 0 || cfg_.maxAwaiting < 0) {
        throw std::invalid_argument("AdmissionController limits must be >= 0");
    }
    if (cfg_.rateWindow.count() > 0 && !timers_) {
        throw std::invalid_argument("AdmissionController needs a TimerQueue for the rate window");
    }
}

AdmissionController::~AdmissionController() {
    Dispose();
}

bool AdmissionController::rateLimitedLocked() const {
    return cfg_.rateWindow.count() > 0 && rateCount_ >= cfg_.rateQuota;
}

bool AdmissionController::activeLimitedLocked() const {
    return cfg_.maxActive > 0 && active_ >= cfg_.maxActive;
}

void AdmissionController::AdmitLocked() {
    ++active_;
    ++admitted_;
    if (cfg_.rateWindow.count() > 0) {
        ++rateCount_;
        if (windowTimer_ == 0) {
            // A stale expiry must not reset a newer window.
            const uint64_t generation = ++windowGeneration_;
            windowTimer_ = timers_->RunAfter(cfg_.rateWindow, [this, generation]() { OnWindowExpired(generation); });
        }
    }
}

AdmissionController::Permit AdmissionController::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (disposed_) {
        throw FetchError(FetchError::Kind::kDisposed, "gateway disposed");
    }

    const bool limited = rateLimitedLocked() || activeLimitedLocked();
    if (!limited && waiters_.empty()) {
        AdmitLocked();
        return Permit(this);
    }

    if (static_cast<int64_t>(waiters_.size()) >= cfg_.maxAwaiting) {
        ++rejected_;
        LOG_WARN << "admission queue overflow: active=" << active_ << " awaiting=" << waiters_.size()
                 << " rateCount=" << rateCount_;
        throw FetchError(FetchError::Kind::kAdmissionLimit, "admission queue overflow");
    }

    auto self = waiters_.insert(waiters_.end(), Waiter{nextSeq_++, false});
    LOG_DEBUG << "admission wait seq=" << self->seq << " position=" << waiters_.size();

    cond_.wait(lock, [this, self]() {
        return self->rejected ||
               (self == waiters_.begin() && !rateLimitedLocked() && !activeLimitedLocked());
    });

    const bool rejected = self->rejected;
    waiters_.erase(self);
    if (rejected) {
        ++rejected_;
        cond_.notify_all();
        throw FetchError(FetchError::Kind::kDisposed, "gateway disposed");
    }

    AdmitLocked();
    cond_.notify_all();
    return Permit(this);
}

void AdmissionController::ReleaseOne() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ > 0) --active_;
    cond_.notify_all();
}

void AdmissionController::OnWindowExpired(uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || windowGeneration_ != generation) return;
    windowTimer_ = 0;
    rateCount_ = 0;
    LOG_DEBUG << "rate window reset, awaiting=" << waiters_.size();
    cond_.notify_all();
}

void AdmissionController::Dispose() {
    common::TimerQueue::TimerId timer = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) return;
        disposed_ = true;
        for (auto& w : waiters_) w.rejected = true;
        timer = windowTimer_;
        windowTimer_ = 0;
        cond_.notify_all();
    }
    // Outside the lock: Cancel() may wait for a running expiry, which takes mutex_.
    if (timer != 0 && timers_) timers_->Cancel(timer);
}

bool AdmissionController::disposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

void AdmissionController::WaitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this]() { return active_ == 0 && waiters_.empty(); });
}

AdmissionController::Snapshot AdmissionController::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Snapshot s;
    s.active = active_;
    s.awaiting = static_cast<int64_t>(waiters_.size());
    s.rateCount = rateCount_;
    s.admitted = admitted_;
    s.rejected = rejected_;
    return s;
}

} // namespace admission
} // namespace egress

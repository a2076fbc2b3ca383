#include "egress/common/TimerQueue.h"
#include "egress/common/Logger.h"

#include <exception>

namespace egress {
namespace common {

TimerQueue::TimerQueue(std::string name)
    : name_(std::move(name)) {
    thread_ = std::thread([this]() { ThreadMain(); });
    LOG_DEBUG << "TimerQueue[" << name_ << "] started";
}

TimerQueue::~TimerQueue() {
    Stop();
}

TimerQueue::TimerId TimerQueue::RunAfter(std::chrono::milliseconds delay, Callback cb) {
    if (delay.count() < 0) delay = std::chrono::milliseconds(0);
    const Clock::time_point when = Clock::now() + delay;

    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_) return 0;
    const TimerId id = nextId_++;
    const bool earliest = timers_.empty() || Key(when, id) < timers_.begin()->first;
    timers_.emplace(Key(when, id), std::move(cb));
    deadlines_.emplace(id, when);
    if (earliest) cond_.notify_one();
    return id;
}

bool TimerQueue::Cancel(TimerId id) {
    if (id == 0) return false;
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = deadlines_.find(id);
    if (it != deadlines_.end()) {
        timers_.erase(Key(it->second, id));
        deadlines_.erase(it);
        return true;
    }
    if (running_ == id && !InTimerThread()) {
        idle_.wait(lock, [this, id]() { return running_ != id; });
    }
    return false;
}

void TimerQueue::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_ && !thread_.joinable()) return;
        stop_ = true;
        timers_.clear();
        deadlines_.clear();
        cond_.notify_all();
    }
    if (thread_.joinable() && !InTimerThread()) {
        thread_.join();
        LOG_DEBUG << "TimerQueue[" << name_ << "] stopped";
    }
}

std::size_t TimerQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void TimerQueue::ThreadMain() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        if (timers_.empty()) {
            cond_.wait(lock);
            continue;
        }
        const Clock::time_point when = timers_.begin()->first.first;
        if (Clock::now() < when) {
            cond_.wait_until(lock, when);
            continue;
        }

        auto first = timers_.begin();
        const TimerId id = first->first.second;
        Callback cb = std::move(first->second);
        timers_.erase(first);
        deadlines_.erase(id);
        running_ = id;

        lock.unlock();
        try {
            if (cb) cb();
        } catch (const std::exception& e) {
            LOG_ERROR << "TimerQueue[" << name_ << "] timer " << id << " threw: " << e.what();
        }
        // Release captured state before anyone waiting in Cancel() resumes.
        cb = nullptr;
        lock.lock();

        running_ = 0;
        idle_.notify_all();
    }
}

} // namespace common
} // namespace egress

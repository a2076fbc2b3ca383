#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

#include "egress/common/noncopyable.h"

namespace egress {
namespace common {

// One-shot timers served by a single background thread.
// Callbacks run on the timer thread, one at a time, in deadline order.
class TimerQueue : noncopyable {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;
    using TimerId = std::uint64_t;

    explicit TimerQueue(std::string name = "egress-timer");
    ~TimerQueue();

    // Returns 0 once the queue is stopped.
    TimerId RunAfter(std::chrono::milliseconds delay, Callback cb);

    // Returns true if the timer was removed before it fired. If the callback is
    // running right now on the timer thread, waits for it to finish (unless called
    // from the timer thread itself) and returns false.
    bool Cancel(TimerId id);

    // Drops all pending timers and joins the thread. Idempotent.
    void Stop();

    std::size_t size() const;
    const std::string& name() const { return name_; }

private:
    void ThreadMain();
    bool InTimerThread() const { return std::this_thread::get_id() == thread_.get_id(); }

    using Key = std::pair<Clock::time_point, TimerId>;

    const std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::condition_variable idle_;
    std::map<Key, Callback> timers_;
    std::unordered_map<TimerId, Clock::time_point> deadlines_;
    TimerId nextId_{1};
    TimerId running_{0};
    bool stop_{false};
    std::thread thread_;
};

} // namespace common
} // namespace egress

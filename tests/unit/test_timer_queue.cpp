#include "egress/common/TimerQueue.h"
#include "egress/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using egress::common::Logger;
using egress::common::TimerQueue;
using std::chrono::milliseconds;

static void testOrdering() {
    TimerQueue q("test-order");
    std::mutex mu;
    std::vector<int> fired;
    q.RunAfter(milliseconds(30), [&]() { std::lock_guard<std::mutex> l(mu); fired.push_back(3); });
    q.RunAfter(milliseconds(10), [&]() { std::lock_guard<std::mutex> l(mu); fired.push_back(1); });
    q.RunAfter(milliseconds(20), [&]() { std::lock_guard<std::mutex> l(mu); fired.push_back(2); });
    std::this_thread::sleep_for(milliseconds(120));
    std::lock_guard<std::mutex> l(mu);
    assert((fired == std::vector<int>{1, 2, 3}));
    assert(q.size() == 0);
}

static void testCancel() {
    TimerQueue q("test-cancel");
    std::atomic<int> count{0};
    const auto id = q.RunAfter(milliseconds(30), [&]() { ++count; });
    assert(id != 0);
    assert(q.size() == 1);
    assert(q.Cancel(id));
    assert(!q.Cancel(id));
    assert(!q.Cancel(0));
    std::this_thread::sleep_for(milliseconds(60));
    assert(count == 0);
}

static void testCancelWaitsForRunningCallback() {
    TimerQueue q("test-running");
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    const auto id = q.RunAfter(milliseconds(0), [&]() {
        started = true;
        std::this_thread::sleep_for(milliseconds(50));
        finished = true;
    });
    while (!started) std::this_thread::sleep_for(milliseconds(1));
    assert(!q.Cancel(id));
    assert(finished);
}

static void testThrowingCallbackDoesNotStopQueue() {
    TimerQueue q("test-throw");
    std::atomic<int> count{0};
    q.RunAfter(milliseconds(0), []() { throw std::runtime_error("boom"); });
    q.RunAfter(milliseconds(10), [&]() { ++count; });
    std::this_thread::sleep_for(milliseconds(60));
    assert(count == 1);
}

static void testStop() {
    TimerQueue q("test-stop");
    std::atomic<int> count{0};
    q.RunAfter(milliseconds(50), [&]() { ++count; });
    q.Stop();
    q.Stop();
    assert(q.RunAfter(milliseconds(0), [&]() { ++count; }) == 0);
    std::this_thread::sleep_for(milliseconds(80));
    assert(count == 0);
}

int main() {
    Logger::Instance().SetLevel(egress::common::LogLevel::FATAL);
    testOrdering();
    testCancel();
    testCancelWaitsForRunningCallback();
    testThrowingCallbackDoesNotStopQueue();
    testStop();
    return 0;
}

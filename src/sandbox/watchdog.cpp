#include "sandbox/watchdog.h"
#include <algorithm>

namespace warden {
namespace sandbox {

static constexpr std::chrono::milliseconds kAbortPollInterval(20);

Watchdog::~Watchdog() {
    disarm();
}

void Watchdog::arm(std::chrono::milliseconds timeout, std::function<void()> onFire,
                   std::function<bool()> shouldAbort) {
    disarm();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        disarmed_ = false;
        onFire_ = std::move(onFire);
        shouldAbort_ = std::move(shouldAbort);
    }
    trigger_ = WatchdogTrigger::NONE;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    thread_ = std::thread(&Watchdog::run, this, deadline);
}

void Watchdog::disarm() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        disarmed_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Watchdog::run(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!disarmed_) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            trigger_ = WatchdogTrigger::DEADLINE;
            break;
        }
        if (shouldAbort_ && shouldAbort_()) {
            trigger_ = WatchdogTrigger::ABORTED;
            break;
        }
        auto wake = shouldAbort_ ? std::min(deadline, now + kAbortPollInterval) : deadline;
        cv_.wait_until(lock, wake);
    }
    if (trigger_ == WatchdogTrigger::NONE) return;
    std::function<void()> fire = onFire_;
    lock.unlock();
    if (fire) fire();
}

}
}

#pragma once

#include <chrono>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace warden {
namespace sandbox {

enum class WatchdogTrigger {
    NONE = 0,
    DEADLINE,
    ABORTED
};

// Runs on its own thread, independent of the supervised code. On expiry,
// or when the abort predicate turns true, it invokes the kill callback once.
class Watchdog {
public:
    Watchdog() = default;
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void arm(std::chrono::milliseconds timeout, std::function<void()> onFire,
             std::function<bool()> shouldAbort = nullptr);
    void disarm();

    WatchdogTrigger trigger() const { return trigger_; }
    bool fired() const { return trigger_ != WatchdogTrigger::NONE; }

private:
    void run(std::chrono::steady_clock::time_point deadline);

    std::thread thread_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool disarmed_ = false;
    std::function<void()> onFire_;
    std::function<bool()> shouldAbort_;
    std::atomic<WatchdogTrigger> trigger_{WatchdogTrigger::NONE};
};

}
}

#include "core/session_lock.h"
#include <algorithm>

namespace warden {
namespace core {

static constexpr std::chrono::milliseconds kCancelPollInterval(50);

const char* lockPolicyName(LockPolicy policy) {
    return policy == LockPolicy::REJECT ? "reject" : "wait";
}

bool parseLockPolicy(const std::string& name, LockPolicy& out) {
    if (name == "wait") { out = LockPolicy::WAIT; return true; }
    if (name == "reject") { out = LockPolicy::REJECT; return true; }
    return false;
}

SessionLockTable::Guard::~Guard() {
    release();
}

SessionLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_), sessionId_(std::move(other.sessionId_)) {
    other.table_ = nullptr;
}

SessionLockTable::Guard& SessionLockTable::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        table_ = other.table_;
        sessionId_ = std::move(other.sessionId_);
        other.table_ = nullptr;
    }
    return *this;
}

void SessionLockTable::Guard::release() {
    if (table_) {
        table_->release(sessionId_);
        table_ = nullptr;
    }
}

SessionLockTable::Guard SessionLockTable::tryAcquire(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mtx_);
    Entry& entry = entries_[sessionId];
    if (entry.held) return Guard();
    entry.held = true;
    return Guard(this, sessionId);
}

SessionLockTable::Guard SessionLockTable::acquire(const std::string& sessionId,
                                                  std::chrono::milliseconds timeout,
                                                  const CancellationToken* cancel) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mtx_);
    Entry& entry = entries_[sessionId];
    entry.waiters++;

    while (entry.held) {
        if (cancel && cancel->isCancelled()) break;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        auto wake = cancel ? std::min(deadline, now + kCancelPollInterval) : deadline;
        cv_.wait_until(lock, wake);
    }

    entry.waiters--;
    if (!entry.held) {
        entry.held = true;
        return Guard(this, sessionId);
    }
    return Guard();
}

bool SessionLockTable::isHeld(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(sessionId);
    return it != entries_.end() && it->second.held;
}

size_t SessionLockTable::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}

void SessionLockTable::release(const std::string& sessionId) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = entries_.find(sessionId);
        if (it == entries_.end()) return;
        it->second.held = false;
        if (it->second.waiters == 0) entries_.erase(it);
    }
    cv_.notify_all();
}

}
}

#pragma once

#include "core/types.h"
#include <string>
#include <chrono>
#include <mutex>
#include <condition_variable>
#include <unordered_map>

namespace warden {
namespace core {

enum class LockPolicy {
    WAIT = 0,
    REJECT
};

const char* lockPolicyName(LockPolicy policy);
bool parseLockPolicy(const std::string& name, LockPolicy& out);

// At most one holder per session id. Entries exist only while a session is
// held or waited on.
class SessionLockTable {
public:
    class Guard {
    public:
        Guard() = default;
        ~Guard();
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        bool owns() const { return table_ != nullptr; }
        explicit operator bool() const { return owns(); }
        const std::string& sessionId() const { return sessionId_; }
        void release();

    private:
        friend class SessionLockTable;
        Guard(SessionLockTable* table, std::string sessionId)
            : table_(table), sessionId_(std::move(sessionId)) {}

        SessionLockTable* table_ = nullptr;
        std::string sessionId_;
    };

    SessionLockTable() = default;
    SessionLockTable(const SessionLockTable&) = delete;
    SessionLockTable& operator=(const SessionLockTable&) = delete;

    Guard tryAcquire(const std::string& sessionId);

    // Waits up to `timeout`; gives up early when the token is cancelled.
    // An empty guard means the lock was not obtained.
    Guard acquire(const std::string& sessionId, std::chrono::milliseconds timeout,
                  const CancellationToken* cancel = nullptr);

    bool isHeld(const std::string& sessionId) const;
    size_t size() const;

private:
    struct Entry {
        bool held = false;
        size_t waiters = 0;
    };

    void release(const std::string& sessionId);

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::unordered_map<std::string, Entry> entries_;
};

}
}

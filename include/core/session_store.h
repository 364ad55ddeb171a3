#pragma once

#include "core/error.h"
#include "core/types.h"
#include <string>
#include <map>
#include <mutex>
#include <chrono>
#include <functional>
#include <cstdint>

namespace warden {
namespace core {

constexpr uint32_t kDefaultSessionTtlSeconds = 3600;

// Per-session data context storage. Expiry is the store's concern.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual Result<DataContext> get(const std::string& sessionId) = 0;
    virtual Result<void> put(const std::string& sessionId, const DataContext& data,
                             uint32_t ttlSeconds = kDefaultSessionTtlSeconds) = 0;
};

class InMemorySessionStore : public SessionStore {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    InMemorySessionStore();
    explicit InMemorySessionStore(Clock clock);

    Result<DataContext> get(const std::string& sessionId) override;
    Result<void> put(const std::string& sessionId, const DataContext& data,
                     uint32_t ttlSeconds = kDefaultSessionTtlSeconds) override;

    bool remove(const std::string& sessionId);
    size_t purgeExpired();
    size_t size() const;

private:
    struct Entry {
        DataContext data;
        std::chrono::steady_clock::time_point expiresAt;
    };

    Clock clock_;
    mutable std::mutex mtx_;
    std::map<std::string, Entry> entries_;
};

}
}

#include "core/session_store.h"

namespace warden {
namespace core {

InMemorySessionStore::InMemorySessionStore()
    : clock_([] { return std::chrono::steady_clock::now(); }) {}

InMemorySessionStore::InMemorySessionStore(Clock clock) : clock_(std::move(clock)) {}

Result<DataContext> InMemorySessionStore::get(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(sessionId);
    if (it == entries_.end()) {
        return Error(ErrorCode::NOT_FOUND, "no data context for session");
    }
    if (clock_() >= it->second.expiresAt) {
        entries_.erase(it);
        return Error(ErrorCode::NOT_FOUND, "data context expired");
    }
    return it->second.data;
}

Result<void> InMemorySessionStore::put(const std::string& sessionId, const DataContext& data,
                                       uint32_t ttlSeconds) {
    if (sessionId.empty()) {
        return Error(ErrorCode::INVALID_CONFIG, "session id must not be empty");
    }
    if (ttlSeconds == 0) {
        return Error(ErrorCode::INVALID_CONFIG, "ttl must be positive");
    }
    std::lock_guard<std::mutex> lock(mtx_);
    Entry& entry = entries_[sessionId];
    entry.data = data;
    entry.expiresAt = clock_() + std::chrono::seconds(ttlSeconds);
    return {};
}

bool InMemorySessionStore::remove(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.erase(sessionId) > 0;
}

size_t InMemorySessionStore::purgeExpired() {
    std::lock_guard<std::mutex> lock(mtx_);
    auto now = clock_();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expiresAt) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t InMemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}

}
}

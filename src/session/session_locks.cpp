#include "session/session_locks.hpp"

namespace pjsk::session {

// ============================================================================
// SessionLock
// ============================================================================

SessionLock::SessionLock(SessionLocks* owner, SessionKey key, std::unique_lock<std::mutex> lock)
    : owner_(owner), key_(std::move(key)), lock_(std::move(lock)) {}

SessionLock::SessionLock(SessionLock&& other) noexcept
    : owner_(other.owner_), key_(other.key_), lock_(std::move(other.lock_)) {
    other.owner_ = nullptr;
}

SessionLock::~SessionLock() {
    if (!owner_) {
        return;
    }
    // The mutex must be free before its slot can be removed
    if (lock_.owns_lock()) {
        lock_.unlock();
    }
    owner_->release(key_);
}

// ============================================================================
// SessionLocks
// ============================================================================

auto SessionLocks::lock(const SessionKey& key) -> SessionLock {
    Slot* target = nullptr;
    {
        std::lock_guard<std::mutex> guard(registry_mutex_);
        auto& slot = locks_[key];
        if (!slot) {
            slot = make_box<Slot>();
        }
        ++slot->holders;
        target = slot.get();
    }
    return SessionLock(this, key, std::unique_lock<std::mutex>(target->mutex));
}

void SessionLocks::release(const SessionKey& key) {
    std::lock_guard<std::mutex> guard(registry_mutex_);
    auto it = locks_.find(key);
    if (it == locks_.end()) {
        return;
    }
    if (--it->second->holders <= 0) {
        locks_.erase(it);
    }
}

auto SessionLocks::size() const -> size_t {
    std::lock_guard<std::mutex> guard(registry_mutex_);
    return locks_.size();
}

} // namespace pjsk::session

//! # Session Locks
//!
//! One mutex per session key. A host that handles commands on several
//! threads holds the key's lock for the whole command so that two commands
//! for the same card never interleave. Distinct keys never contend.
//!
//! A key's slot lives only while some thread holds or waits for it, so the
//! registry stays as small as the number of commands in flight.

#ifndef PJSK_SESSION_SESSION_LOCKS_HPP
#define PJSK_SESSION_SESSION_LOCKS_HPP

#include "common.hpp"
#include "session/session_key.hpp"

#include <mutex>
#include <unordered_map>

namespace pjsk::session {

class SessionLocks;

/// Holds one key's lock until destroyed.
class SessionLock {
public:
    SessionLock(SessionLock&& other) noexcept;
    SessionLock(const SessionLock&) = delete;
    auto operator=(const SessionLock&) -> SessionLock& = delete;
    auto operator=(SessionLock&&) -> SessionLock& = delete;
    ~SessionLock();

    [[nodiscard]] auto owns_lock() const -> bool {
        return lock_.owns_lock();
    }

private:
    friend class SessionLocks;
    SessionLock(SessionLocks* owner, SessionKey key, std::unique_lock<std::mutex> lock);

    SessionLocks* owner_;
    SessionKey key_;
    std::unique_lock<std::mutex> lock_;
};

class SessionLocks {
public:
    /// Blocks until the lock for `key` is held.
    [[nodiscard]] auto lock(const SessionKey& key) -> SessionLock;

    /// Number of keys currently held or waited on.
    [[nodiscard]] auto size() const -> size_t;

private:
    friend class SessionLock;

    struct Slot {
        std::mutex mutex;
        int holders = 0;
    };

    /// Drops one holder of `key`, removing the slot when none remain.
    void release(const SessionKey& key);

    mutable std::mutex registry_mutex_;
    std::unordered_map<SessionKey, Box<Slot>> locks_;
};

} // namespace pjsk::session

#endif // PJSK_SESSION_SESSION_LOCKS_HPP

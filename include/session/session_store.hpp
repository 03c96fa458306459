//! # Session Store
//!
//! In-memory map from session key to the current card. Authoritative for
//! the lifetime of the process only; the durable tier rehydrates it.
//! Each entry remembers when it was last written, so a long-running host
//! expires idle cards on the same TTL as the durable tier.
//! Not synchronized: hosts serialize access per key (see `SessionLocks`).

#ifndef PJSK_SESSION_SESSION_STORE_HPP
#define PJSK_SESSION_SESSION_STORE_HPP

#include "card/render_config.hpp"
#include "session/session_key.hpp"

#include <optional>
#include <unordered_map>

namespace pjsk::session {

class SessionStore {
public:
    explicit SessionStore(Clock clock = system_clock_seconds);

    /// A copy of the stored card, or `nullopt`. Ignores age.
    [[nodiscard]] auto get(const SessionKey& key) const -> std::optional<card::RenderConfig>;

    /// A copy of the stored card if it was written within `ttl_hours`.
    /// A stale entry is removed and reported as missing.
    auto get(const SessionKey& key, double ttl_hours) -> std::optional<card::RenderConfig>;

    /// Stores the card and stamps it with the current time.
    void set(const SessionKey& key, card::RenderConfig config);

    [[nodiscard]] auto exists(const SessionKey& key) const -> bool;

    /// Returns whether an entry was removed.
    auto erase(const SessionKey& key) -> bool;

    /// Removes every entry older than `ttl_hours`; returns how many.
    auto evict_expired(double ttl_hours) -> size_t;

    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

private:
    struct Entry {
        card::RenderConfig config;
        double touched_at = 0.0;
    };

    [[nodiscard]] auto is_stale(const Entry& entry, double now, double ttl_hours) const -> bool {
        return now - entry.touched_at > ttl_hours * 3600.0;
    }

    Clock clock_;
    std::unordered_map<SessionKey, Entry> entries_;
};

} // namespace pjsk::session

#endif // PJSK_SESSION_SESSION_STORE_HPP

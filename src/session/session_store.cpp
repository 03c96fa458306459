#include "session/session_store.hpp"

#include "log/log.hpp"

namespace pjsk::session {

SessionStore::SessionStore(Clock clock) : clock_(std::move(clock)) {}

auto SessionStore::get(const SessionKey& key) const -> std::optional<card::RenderConfig> {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.config;
}

auto SessionStore::get(const SessionKey& key, double ttl_hours)
    -> std::optional<card::RenderConfig> {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (is_stale(it->second, clock_(), ttl_hours)) {
        PJSK_LOG_DEBUG("session", "In-memory card for " << key.storage_key() << " expired");
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.config;
}

void SessionStore::set(const SessionKey& key, card::RenderConfig config) {
    entries_.insert_or_assign(key, Entry{std::move(config), clock_()});
}

auto SessionStore::exists(const SessionKey& key) const -> bool {
    return entries_.find(key) != entries_.end();
}

auto SessionStore::erase(const SessionKey& key) -> bool {
    return entries_.erase(key) > 0;
}

auto SessionStore::evict_expired(double ttl_hours) -> size_t {
    double now = clock_();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (is_stale(it->second, now, ttl_hours)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace pjsk::session

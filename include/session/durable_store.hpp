//! # Durable Store
//!
//! File-backed, TTL-governed snapshots of card configurations.
//!
//! ## Document Layout
//!
//! ```json
//! {
//!   "last_updated": 1718000000.25,
//!   "states": {
//!     "qq:10001": {
//!       "config": {"text": "...", "font_size": 42, ...},
//!       "timestamp": 1718000000.25
//!     }
//!   }
//! }
//! ```
//!
//! Entries written by older versions under `"state"` instead of `"config"`
//! are still read. An entry without a timestamp never expires.
//!
//! ## Failure Model
//!
//! A missing, unreadable or corrupt document reads as empty. Write failures
//! are logged and reported through the boolean results; nothing throws.
//! Every mutation is a whole-document load-modify-rewrite, so concurrent
//! writers to the same key race and the last one wins.

#ifndef PJSK_SESSION_DURABLE_STORE_HPP
#define PJSK_SESSION_DURABLE_STORE_HPP

#include "card/render_config.hpp"
#include "json/json_value.hpp"
#include "session/session_key.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace pjsk::session {

namespace fs = std::filesystem;

class DurableStore {
public:
    /// # Arguments
    ///
    /// * `path` - Location of the document; parent directories are created
    ///   on first write
    /// * `clock` - Time source, injectable for tests
    explicit DurableStore(fs::path path, Clock clock = system_clock_seconds);

    /// Loads the snapshot for `key`.
    ///
    /// An entry older than `ttl_hours` is deleted from the document (which
    /// is rewritten) and reported as absent.
    [[nodiscard]] auto get(const SessionKey& key, double ttl_hours)
        -> std::optional<card::RenderConfig>;

    /// Stores `config` for `key` stamped with the current time.
    auto set(const SessionKey& key, const card::RenderConfig& config) -> bool;

    /// Removes the entry for `key`; the document is rewritten only if an
    /// entry was present. Returns whether the removal reached the disk.
    auto remove(const SessionKey& key) -> bool;

    /// Removes every entry older than `ttl_hours` in one pass and returns
    /// how many were removed.
    auto cleanup_expired(double ttl_hours) -> size_t;

    /// Every entry that deserializes, keyed by "channel:identity", without
    /// applying the TTL. Used for diagnostics.
    [[nodiscard]] auto get_all() const -> std::map<std::string, card::RenderConfig>;

    [[nodiscard]] auto path() const -> const fs::path& {
        return path_;
    }

private:
    fs::path path_;
    Clock clock_;

    /// The "states" object of the document, or an empty object.
    [[nodiscard]] auto load_states() const -> json::JsonValue;

    auto save_states(json::JsonValue states) -> bool;

    [[nodiscard]] auto is_expired(const json::JsonValue& entry, double now,
                                  double ttl_hours) const -> bool;
};

} // namespace pjsk::session

#endif // PJSK_SESSION_DURABLE_STORE_HPP

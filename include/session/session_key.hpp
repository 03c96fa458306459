//! # Session Keys
//!
//! A session key is the `(channel, identity)` pair that names one
//! independent card. The boundary layer describes the requester through
//! `RequesterInfo`; `make_session_key` picks the identity in a fixed
//! fallback order: session id, sender id, sender display name.

#ifndef PJSK_SESSION_SESSION_KEY_HPP
#define PJSK_SESSION_SESSION_KEY_HPP

#include <functional>
#include <optional>
#include <string>

namespace pjsk::session {

/// Source of the current time in Unix seconds.
using Clock = std::function<double()>;

/// The wall clock.
[[nodiscard]] auto system_clock_seconds() -> double;

/// Two non-empty strings identifying one card stream.
class SessionKey {
public:
    /// # Panics
    ///
    /// Throws `std::invalid_argument` if either part is empty.
    SessionKey(std::string channel, std::string identity);

    [[nodiscard]] auto channel() const -> const std::string& {
        return channel_;
    }
    [[nodiscard]] auto identity() const -> const std::string& {
        return identity_;
    }

    /// "channel:identity", the key used in the durable document.
    [[nodiscard]] auto storage_key() const -> std::string {
        return channel_ + ":" + identity_;
    }

    [[nodiscard]] auto operator==(const SessionKey& other) const -> bool = default;

private:
    std::string channel_;
    std::string identity_;
};

/// What the host framework knows about the sender of a command.
struct RequesterInfo {
    std::string channel;
    std::optional<std::string> session_id;
    std::optional<std::string> sender_id;
    std::optional<std::string> sender_name;
};

/// First non-empty of session id, sender id and sender name; "unknown" if
/// none is present.
[[nodiscard]] auto resolve_identity(const RequesterInfo& requester) -> std::string;

/// Builds the key for `requester`; an empty channel becomes "unknown".
[[nodiscard]] auto make_session_key(const RequesterInfo& requester) -> SessionKey;

} // namespace pjsk::session

template <> struct std::hash<pjsk::session::SessionKey> {
    auto operator()(const pjsk::session::SessionKey& key) const noexcept -> size_t {
        size_t h1 = std::hash<std::string>{}(key.channel());
        size_t h2 = std::hash<std::string>{}(key.identity());
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

#endif // PJSK_SESSION_SESSION_KEY_HPP

#include "session/session_key.hpp"

#include <chrono>
#include <stdexcept>

namespace pjsk::session {

namespace {

constexpr const char* UNKNOWN = "unknown";

auto non_empty(const std::optional<std::string>& value) -> bool {
    return value.has_value() && !value->empty();
}

} // namespace

auto system_clock_seconds() -> double {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

SessionKey::SessionKey(std::string channel, std::string identity)
    : channel_(std::move(channel)), identity_(std::move(identity)) {
    if (channel_.empty() || identity_.empty()) {
        throw std::invalid_argument("session key requires a non-empty channel and identity");
    }
}

auto resolve_identity(const RequesterInfo& requester) -> std::string {
    if (non_empty(requester.session_id)) {
        return *requester.session_id;
    }
    if (non_empty(requester.sender_id)) {
        return *requester.sender_id;
    }
    if (non_empty(requester.sender_name)) {
        return *requester.sender_name;
    }
    return UNKNOWN;
}

auto make_session_key(const RequesterInfo& requester) -> SessionKey {
    return SessionKey(requester.channel.empty() ? UNKNOWN : requester.channel,
                      resolve_identity(requester));
}

} // namespace pjsk::session

//! # Interactive Sessions
//!
//! Short-lived multi-step flows, such as "pick a persona by number". At
//! most one flow exists per session key; starting a new one cancels the
//! previous flow. Timeouts are evaluated lazily on access and by the
//! optional `sweep_expired` pass; there is no background timer.

#ifndef PJSK_SESSION_INTERACTIVE_SESSION_HPP
#define PJSK_SESSION_INTERACTIVE_SESSION_HPP

#include "session/durable_store.hpp"
#include "session/session_key.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace pjsk::session {

enum class FlowState {
    WaitingCharacterSelection,
    WaitingTextInput,
    Completed,
    Timeout,
    Cancelled
};

/// Returns the snake_case name of a flow state.
[[nodiscard]] auto flow_state_name(FlowState state) -> const char*;

/// One in-progress flow.
struct InteractiveSession {
    std::string flow_id;
    SessionKey key;
    FlowState state;
    double created_at = 0.0;
    double last_activity = 0.0;
    double timeout_seconds = 30.0;
    std::optional<std::string> selected_persona;

    [[nodiscard]] auto is_expired(double now) const -> bool {
        return now - last_activity > timeout_seconds;
    }
};

/// Tracks flows per session key.
class InteractiveSessionManager {
public:
    static constexpr double DEFAULT_TIMEOUT_SECONDS = 30.0;

    explicit InteractiveSessionManager(Clock clock = system_clock_seconds);

    /// Starts a flow for `key`, cancelling any existing one.
    auto create(const SessionKey& key, FlowState initial = FlowState::WaitingCharacterSelection,
                double timeout_seconds = DEFAULT_TIMEOUT_SECONDS) -> InteractiveSession;

    /// The live flow for `key`; an expired flow is dropped and reported
    /// absent.
    [[nodiscard]] auto get(const SessionKey& key) -> std::optional<InteractiveSession>;

    /// Moves a live flow to `state` and/or records a persona, refreshing its
    /// activity time. Terminal states remove the flow.
    auto update(const SessionKey& key, std::optional<FlowState> state,
                std::optional<std::string> selected_persona = std::nullopt)
        -> std::optional<InteractiveSession>;

    /// Cancels the flow for `key`; returns whether one was live.
    auto cancel(const SessionKey& key) -> bool;

    /// Drops every expired flow and returns how many were dropped.
    auto sweep_expired() -> size_t;

    /// Number of flows currently tracked (expired ones included until
    /// they are touched or swept).
    [[nodiscard]] auto size() const -> size_t {
        return flows_.size();
    }

private:
    Clock clock_;
    std::unordered_map<SessionKey, InteractiveSession> flows_;
};

} // namespace pjsk::session

#endif // PJSK_SESSION_INTERACTIVE_SESSION_HPP

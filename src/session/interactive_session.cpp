#include "session/interactive_session.hpp"

#include "log/log.hpp"

#include <cmath>

namespace pjsk::session {

namespace {

auto is_terminal(FlowState state) -> bool {
    return state == FlowState::Completed || state == FlowState::Timeout ||
           state == FlowState::Cancelled;
}

} // namespace

auto flow_state_name(FlowState state) -> const char* {
    switch (state) {
    case FlowState::WaitingCharacterSelection:
        return "waiting_character_selection";
    case FlowState::WaitingTextInput:
        return "waiting_text_input";
    case FlowState::Completed:
        return "completed";
    case FlowState::Timeout:
        return "timeout";
    case FlowState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

InteractiveSessionManager::InteractiveSessionManager(Clock clock) : clock_(std::move(clock)) {}

auto InteractiveSessionManager::create(const SessionKey& key, FlowState initial,
                                       double timeout_seconds) -> InteractiveSession {
    double now = clock_();
    if (auto it = flows_.find(key); it != flows_.end()) {
        PJSK_LOG_DEBUG("session", "Cancelling flow " << it->second.flow_id << " for "
                                                     << key.storage_key());
        flows_.erase(it);
    }

    InteractiveSession flow{key.channel() + "_" + key.identity() + "_" +
                                std::to_string(static_cast<long long>(std::floor(now))),
                            key,
                            initial,
                            now,
                            now,
                            timeout_seconds,
                            std::nullopt};
    flows_.insert_or_assign(key, flow);
    PJSK_LOG_DEBUG("session", "Created flow " << flow.flow_id << " in state "
                                              << flow_state_name(initial));
    return flow;
}

auto InteractiveSessionManager::get(const SessionKey& key) -> std::optional<InteractiveSession> {
    auto it = flows_.find(key);
    if (it == flows_.end()) {
        return std::nullopt;
    }
    if (it->second.is_expired(clock_())) {
        PJSK_LOG_DEBUG("session", "Flow " << it->second.flow_id << " timed out");
        flows_.erase(it);
        return std::nullopt;
    }
    return it->second;
}

auto InteractiveSessionManager::update(const SessionKey& key, std::optional<FlowState> state,
                                       std::optional<std::string> selected_persona)
    -> std::optional<InteractiveSession> {
    auto it = flows_.find(key);
    double now = clock_();
    if (it == flows_.end()) {
        return std::nullopt;
    }
    if (it->second.is_expired(now)) {
        flows_.erase(it);
        return std::nullopt;
    }

    auto& flow = it->second;
    if (state) {
        flow.state = *state;
    }
    if (selected_persona) {
        flow.selected_persona = std::move(selected_persona);
    }
    flow.last_activity = now;

    InteractiveSession snapshot = flow;
    if (is_terminal(snapshot.state)) {
        flows_.erase(it);
    }
    return snapshot;
}

auto InteractiveSessionManager::cancel(const SessionKey& key) -> bool {
    auto current = get(key);
    if (!current) {
        return false;
    }
    return update(key, FlowState::Cancelled).has_value();
}

auto InteractiveSessionManager::sweep_expired() -> size_t {
    double now = clock_();
    size_t removed = 0;
    for (auto it = flows_.begin(); it != flows_.end();) {
        if (it->second.is_expired(now)) {
            it = flows_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        PJSK_LOG_DEBUG("session", "Swept " << removed << " expired flows");
    }
    return removed;
}

} // namespace pjsk::session

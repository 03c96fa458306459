//! # Render Coordinator
//!
//! The command boundary. Each entry point takes the requester's capability
//! fields and the raw message, and returns a finished `Reply`.
//!
//! ## Pipeline
//!
//! ```text
//! message -> interpreter (on a copy of the current card)
//!         -> SessionStore.set + DurableStore.set
//!         -> RendererHandle.render
//!         -> Reply
//! ```
//!
//! State is committed before the render starts, so a failed render never
//! loses a change. Commands for the same session are serialized with a
//! per-key lock; the store maps themselves sit behind one short-held mutex.

#ifndef PJSK_RENDER_RENDER_COORDINATOR_HPP
#define PJSK_RENDER_RENDER_COORDINATOR_HPP

#include "card/catalog.hpp"
#include "card/creation_flags.hpp"
#include "card/interpreter.hpp"
#include "card/render_config.hpp"
#include "card/vocabulary.hpp"
#include "common.hpp"
#include "render/renderer.hpp"
#include "render/reply.hpp"
#include "session/durable_store.hpp"
#include "session/interactive_session.hpp"
#include "session/session_key.hpp"
#include "session/session_locks.hpp"
#include "session/session_store.hpp"

#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace pjsk::render {

/// Behaviour switches and constants the coordinator reads on every command.
struct CoordinatorSettings {
    card::CardLimits limits;
    card::CardDefaults defaults;

    double curve_intensity = 0.5;
    bool shadow_enabled = true;
    std::string emoji_set = "apple";

    /// Shrink the font of a new card until its longest line fits.
    bool adaptive_text_sizing = true;
    /// Include the state summary in render replies.
    bool show_success_messages = true;
    /// Prefix render replies with "@sender ".
    bool mention_user_on_render = false;

    bool persistence_enabled = true;
    double state_ttl_hours = 24.0;

    double selection_timeout_seconds =
        session::InteractiveSessionManager::DEFAULT_TIMEOUT_SECONDS;
};

/// What a maintenance pass removed.
struct CleanupReport {
    size_t expired_entries = 0;
    size_t evicted_cards = 0;
    size_t expired_flows = 0;
};

class RenderCoordinator {
public:
    /// Creates a coordinator.
    ///
    /// # Arguments
    ///
    /// * `settings` - Limits, defaults and feature switches
    /// * `vocabulary` - Shared command alias tables
    /// * `catalog` - Shared persona catalog
    /// * `renderer` - Long-lived renderer handle owned by the host
    /// * `durable` - Durable tier; may be null, and is dropped when
    ///   persistence is disabled
    /// * `clock` - Time source for in-memory expiry and selection flows
    /// * `seed` - Seed for random persona selection
    RenderCoordinator(CoordinatorSettings settings, Rc<const card::CommandVocabulary> vocabulary,
                      Rc<const card::PersonaCatalog> catalog, RendererHandle& renderer,
                      Box<session::DurableStore> durable,
                      session::Clock clock = session::system_clock_seconds,
                      uint32_t seed = std::random_device{}());

    /// Creates the session's card on first use, or updates the existing one
    /// with free text or creation flags, then renders.
    auto draw(const session::RequesterInfo& requester, std::string_view message) -> Reply;

    /// Applies one adjustment command to the existing card and renders.
    /// An empty message returns usage guidance.
    auto adjust(const session::RequesterInfo& requester, std::string_view message) -> Reply;

    /// Persona listings: `all`, `groups`, or `expand <name>`.
    auto list(std::string_view message) -> Reply;

    /// Selects a persona by 1-based index or alias, creating the card if
    /// needed. Without an argument, opens a selection flow and replies with
    /// the numbered list.
    auto select(const session::RequesterInfo& requester, std::string_view message) -> Reply;

    /// Summary of the current card without rendering.
    auto show(const session::RequesterInfo& requester) -> Reply;

    /// Deletes the session's card from both tiers and cancels its flow.
    auto forget(const session::RequesterInfo& requester) -> Reply;

    /// Removes expired durable entries, idle in-memory cards and expired
    /// selection flows.
    auto cleanup() -> CleanupReport;

    [[nodiscard]] auto settings() const -> const CoordinatorSettings& {
        return settings_;
    }

    /// The durable tier, or null when persistence is off.
    [[nodiscard]] auto durable() const -> const session::DurableStore* {
        return durable_.get();
    }

    /// Copy of the in-memory card for `key`, if any.
    [[nodiscard]] auto cached(const session::SessionKey& key) const
        -> std::optional<card::RenderConfig>;

    /// Whether a selection flow is open for `key`.
    [[nodiscard]] auto has_open_flow(const session::SessionKey& key) -> bool;

private:
    CoordinatorSettings settings_;
    Rc<const card::CommandVocabulary> vocabulary_;
    Rc<const card::PersonaCatalog> catalog_;
    card::CommandInterpreter interpreter_;
    RendererHandle& renderer_;

    mutable std::mutex stores_mutex_;
    session::SessionStore sessions_;
    Box<session::DurableStore> durable_;
    session::InteractiveSessionManager flows_;
    session::SessionLocks locks_;

    /// SessionStore, then DurableStore with promotion, then MissingState.
    /// The caller holds the key's session lock.
    auto require_state(const session::SessionKey& key)
        -> Result<card::RenderConfig, card::AdjustError>;

    /// Writes both tiers. Durable failures are logged and do not fail the
    /// command.
    void commit(const session::SessionKey& key, const card::RenderConfig& config);

    auto render_reply(const session::RequesterInfo& requester, const card::RenderConfig& config,
                      std::string_view headline, bool default_font) -> Reply;

    void apply_flags(card::RenderConfig& config, const card::CreationFlags& flags);

    void adapt_font_size(card::RenderConfig& config);

    [[nodiscard]] auto make_request(const card::RenderConfig& config, bool default_font) const
        -> RenderRequest;
};

} // namespace pjsk::render

#endif // PJSK_RENDER_RENDER_COORDINATOR_HPP

#include "render/render_coordinator.hpp"

#include "card/layout.hpp"
#include "card/text_utils.hpp"
#include "card/tokenizer.hpp"
#include "log/log.hpp"

#include <sstream>

namespace pjsk::render {

namespace {

constexpr const char* HEADLINE_CREATED = "🎨 initial render done";
constexpr const char* HEADLINE_RERENDERED = "🎨 re-rendered";
constexpr const char* RENDER_FAILED_MESSAGE = "render failed, please retry";

auto list_usage() -> std::string {
    return "pjsk.列表 usage:\n"
           "• 全部 / all - every persona, numbered\n"
           "• 角色分类 / groups - personas by group\n"
           "• 展开 / expand <name> - aliases and group of one persona";
}

} // namespace

RenderCoordinator::RenderCoordinator(CoordinatorSettings settings,
                                     Rc<const card::CommandVocabulary> vocabulary,
                                     Rc<const card::PersonaCatalog> catalog,
                                     RendererHandle& renderer, Box<session::DurableStore> durable,
                                     session::Clock clock, uint32_t seed)
    : settings_(std::move(settings)), vocabulary_(std::move(vocabulary)),
      catalog_(std::move(catalog)), interpreter_(vocabulary_, catalog_, settings_.limits, seed),
      renderer_(renderer), sessions_(clock), durable_(std::move(durable)),
      flows_(std::move(clock)) {
    if (!settings_.persistence_enabled && durable_) {
        PJSK_LOG_INFO("session", "Persistence disabled, durable tier not used");
        durable_.reset();
    }
}

// ============================================================================
// State Access
// ============================================================================

auto RenderCoordinator::require_state(const session::SessionKey& key)
    -> Result<card::RenderConfig, card::AdjustError> {
    std::lock_guard<std::mutex> lock(stores_mutex_);
    if (auto config = sessions_.get(key, settings_.state_ttl_hours)) {
        return *config;
    }
    if (durable_) {
        if (auto config = durable_->get(key, settings_.state_ttl_hours)) {
            PJSK_LOG_DEBUG("session", "Restored " << key.storage_key() << " from durable tier");
            sessions_.set(key, *config);
            return *config;
        }
    }
    return card::AdjustError::missing_state();
}

void RenderCoordinator::commit(const session::SessionKey& key, const card::RenderConfig& config) {
    std::lock_guard<std::mutex> lock(stores_mutex_);
    sessions_.set(key, config);
    if (durable_ && !durable_->set(key, config)) {
        PJSK_LOG_WARN("session", "Card for " << key.storage_key()
                                             << " kept in memory only, durable write failed");
    }
}

auto RenderCoordinator::cached(const session::SessionKey& key) const
    -> std::optional<card::RenderConfig> {
    std::lock_guard<std::mutex> lock(stores_mutex_);
    return sessions_.get(key);
}

auto RenderCoordinator::has_open_flow(const session::SessionKey& key) -> bool {
    std::lock_guard<std::mutex> lock(stores_mutex_);
    return flows_.get(key).has_value();
}

// ============================================================================
// Rendering
// ============================================================================

auto RenderCoordinator::make_request(const card::RenderConfig& config, bool default_font) const
    -> RenderRequest {
    RenderRequest request;
    request.text = config.text;
    request.persona = config.role;
    request.font_size = config.font_size;
    request.line_spacing = config.line_spacing;
    request.curve_enabled = config.curve_enabled;
    request.offset_x = config.offset_x;
    request.offset_y = config.offset_y;
    request.curve_intensity = card::clamp_curve_intensity(settings_.curve_intensity);
    request.shadow_enabled = settings_.shadow_enabled;
    request.emoji_set = settings_.emoji_set;
    request.default_font = default_font;
    return request;
}

auto RenderCoordinator::render_reply(const session::RequesterInfo& requester,
                                     const card::RenderConfig& config, std::string_view headline,
                                     bool default_font) -> Reply {
    auto rendered = renderer_.render(make_request(config, default_font)).get();
    if (is_err(rendered)) {
        const auto& error = unwrap_err(rendered);
        PJSK_LOG_ERROR("render", "Render failed: " << error.message);
        return Reply::error(RENDER_FAILED_MESSAGE);
    }

    Reply reply;
    reply.image = std::move(unwrap(rendered));
    reply.buttons = adjustment_buttons();
    if (settings_.show_success_messages) {
        reply.text = format_summary(config, headline);
    }
    if (settings_.mention_user_on_render && requester.sender_name) {
        reply.text = with_mention(reply.text, *requester.sender_name);
    }
    return reply;
}

// ============================================================================
// Creation
// ============================================================================

void RenderCoordinator::apply_flags(card::RenderConfig& config, const card::CreationFlags& flags) {
    const auto& limits = settings_.limits;
    if (flags.text) {
        auto text = card::sanitize_text(*flags.text, limits.max_text_length);
        if (!text.empty()) {
            config.text = std::move(text);
        }
    }
    if (flags.font_size) {
        config.font_size = limits.clamp_font_size(*flags.font_size);
    }
    if (flags.line_spacing) {
        config.line_spacing = limits.clamp_line_spacing(*flags.line_spacing);
    }
    if (flags.offset_x) {
        config.offset_x = limits.clamp_offset(*flags.offset_x);
    }
    if (flags.offset_y) {
        config.offset_y = limits.clamp_offset(*flags.offset_y);
    }
    if (flags.curve) {
        config.curve_enabled = true;
    }
    if (flags.random_role()) {
        auto picked = interpreter_.apply(config, card::CMD_ROLE, {}, "-r");
        if (is_err(picked)) {
            PJSK_LOG_WARN("session", "Random persona not applied: " << unwrap_err(picked).message);
        }
    } else if (flags.role) {
        if (auto resolved = catalog_->resolve(*flags.role)) {
            config.role = *resolved;
        } else {
            PJSK_LOG_WARN("session", "Ignoring unknown persona '" << *flags.role << "'");
        }
    }
}

void RenderCoordinator::adapt_font_size(card::RenderConfig& config) {
    int fitted = card::calculate_font_size(config.text, card::ADAPTIVE_TARGET_WIDTH,
                                           settings_.limits.font_size_min,
                                           settings_.defaults.font_size);
    fitted = settings_.limits.clamp_font_size(fitted);
    if (fitted != config.font_size) {
        PJSK_LOG_DEBUG("session", "Adaptive sizing: " << config.font_size << "px -> " << fitted
                                                      << "px");
        config.font_size = fitted;
    }
}

// ============================================================================
// Commands
// ============================================================================

auto RenderCoordinator::draw(const session::RequesterInfo& requester, std::string_view message)
    -> Reply {
    auto key = session::make_session_key(requester);
    auto guard = locks_.lock(key);
    std::string trimmed = card::trim(message);

    auto existing = require_state(key);
    bool created = is_err(existing);
    card::RenderConfig config =
        created ? card::RenderConfig::make_default(settings_.defaults, settings_.limits)
                : std::move(unwrap(existing));

    bool default_font = false;
    bool explicit_size = false;
    if (card::is_flag_style(trimmed)) {
        auto flags = card::parse_creation_flags(card::split_args(trimmed));
        apply_flags(config, flags);
        default_font = flags.default_font;
        explicit_size = flags.font_size.has_value();
    } else if (!trimmed.empty()) {
        config.text = card::sanitize_text(trimmed, settings_.limits.max_text_length);
    }

    if (created && settings_.adaptive_text_sizing && !explicit_size && !default_font) {
        adapt_font_size(config);
    }

    commit(key, config);
    PJSK_LOG_INFO("session", (created ? "Created" : "Updated") << " card for "
                                                               << key.storage_key());
    return render_reply(requester, config, created ? HEADLINE_CREATED : HEADLINE_RERENDERED,
                        default_font);
}

auto RenderCoordinator::adjust(const session::RequesterInfo& requester, std::string_view message)
    -> Reply {
    std::string trimmed = card::trim(message);
    if (trimmed.empty()) {
        return Reply::ok(format_guidance());
    }

    auto key = session::make_session_key(requester);
    auto guard = locks_.lock(key);

    auto state = require_state(key);
    if (is_err(state)) {
        return Reply::error(unwrap_err(state).message);
    }
    card::RenderConfig config = std::move(unwrap(state));

    auto applied = interpreter_.apply_message(config, trimmed);
    if (is_err(applied)) {
        PJSK_LOG_DEBUG("interp", "Rejected '" << trimmed << "': " << unwrap_err(applied).message);
        return Reply::error(unwrap_err(applied).message);
    }

    commit(key, config);
    return render_reply(requester, config, unwrap(applied), false);
}

auto RenderCoordinator::list(std::string_view message) -> Reply {
    std::string trimmed = card::trim(message);
    if (trimmed.empty()) {
        Reply reply = Reply::ok(list_usage());
        reply.buttons = list_buttons();
        return reply;
    }

    auto [first, remainder] = card::extract_first_token(trimmed);
    auto [head, variants] = card::split_dotted(first);
    auto subcommand = vocabulary_->list_subcommands.resolve(head);
    if (!subcommand) {
        return Reply::error("unrecognized list subcommand: " + first);
    }

    if (*subcommand == card::LIST_ALL) {
        Reply reply = Reply::ok(catalog_->format_list());
        reply.buttons = list_buttons();
        return reply;
    }
    if (*subcommand == card::LIST_GROUPS) {
        Reply reply = Reply::ok(catalog_->format_groups());
        reply.buttons = list_buttons();
        return reply;
    }

    // expand: "展开 miku" or "展开.miku"
    std::string name = card::trim(remainder);
    if (name.empty() && !variants.empty()) {
        name = variants.front();
    }
    if (name.empty()) {
        return Reply::error("provide a persona name to expand");
    }
    auto resolved = catalog_->resolve(name);
    if (!resolved) {
        return Reply::error("persona not found: " + name);
    }
    return Reply::ok(catalog_->format_detail(*resolved));
}

auto RenderCoordinator::select(const session::RequesterInfo& requester, std::string_view message)
    -> Reply {
    auto key = session::make_session_key(requester);
    auto guard = locks_.lock(key);
    std::string trimmed = card::trim(message);

    if (trimmed.empty()) {
        {
            std::lock_guard<std::mutex> lock(stores_mutex_);
            flows_.create(key, session::FlowState::WaitingCharacterSelection,
                          settings_.selection_timeout_seconds);
        }
        std::ostringstream text;
        text << "Choose a persona by number or name:\n\n"
             << catalog_->format_list() << "\n\n"
             << "Reply with /pjsk.select <number|name> within "
             << static_cast<int>(settings_.selection_timeout_seconds) << " seconds.";
        return Reply::ok(text.str());
    }

    auto selected = catalog_->resolve_selection(trimmed);
    if (!selected) {
        return Reply::error("invalid selection: " + trimmed + ", enter a number from 1 to " +
                            std::to_string(catalog_->names().size()) + " or a persona name");
    }

    {
        std::lock_guard<std::mutex> lock(stores_mutex_);
        if (flows_.get(key)) {
            flows_.update(key, session::FlowState::Completed, *selected);
        }
    }

    auto existing = require_state(key);
    bool created = is_err(existing);
    card::RenderConfig config =
        created ? card::RenderConfig::make_default(settings_.defaults, settings_.limits)
                : std::move(unwrap(existing));
    config.role = *selected;

    commit(key, config);
    return render_reply(requester, config, "persona switched to " + *selected, false);
}

auto RenderCoordinator::show(const session::RequesterInfo& requester) -> Reply {
    auto key = session::make_session_key(requester);
    auto guard = locks_.lock(key);
    auto state = require_state(key);
    if (is_err(state)) {
        return Reply::error(unwrap_err(state).message);
    }
    return Reply::ok(format_summary(unwrap(state), "Current card"));
}

auto RenderCoordinator::forget(const session::RequesterInfo& requester) -> Reply {
    auto key = session::make_session_key(requester);
    auto guard = locks_.lock(key);

    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(stores_mutex_);
        removed = sessions_.erase(key);
        if (durable_ && durable_->remove(key)) {
            removed = true;
        }
        flows_.cancel(key);
    }

    if (!removed) {
        return Reply::ok("no card to forget");
    }
    PJSK_LOG_INFO("session", "Forgot card for " << key.storage_key());
    return Reply::ok("card forgotten");
}

auto RenderCoordinator::cleanup() -> CleanupReport {
    std::lock_guard<std::mutex> lock(stores_mutex_);
    CleanupReport report;
    report.evicted_cards = sessions_.evict_expired(settings_.state_ttl_hours);
    if (durable_) {
        report.expired_entries = durable_->cleanup_expired(settings_.state_ttl_hours);
    }
    report.expired_flows = flows_.sweep_expired();
    PJSK_LOG_INFO("session", "Cleanup removed " << report.expired_entries << " entries, "
                                                << report.evicted_cards << " cached cards and "
                                                << report.expired_flows << " flows");
    return report;
}

} // namespace pjsk::render

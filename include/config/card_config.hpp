//! # Card Configuration
//!
//! Startup configuration read from `pjsk.toml`.
//!
//! ## Example
//!
//! ```toml
//! [limits]
//! font_size_min = 18
//! font_size_max = 84
//!
//! [defaults]
//! role = "初音未来"
//!
//! [persistence]
//! state_ttl_hours = 24
//!
//! [personas]
//! "初音未来" = ["初音", "miku"]
//!
//! [groups]
//! "MORE MORE JUMP!" = ["初音未来"]
//! ```
//!
//! Every key is optional. A `[personas]` section replaces the built-in
//! persona set; a `[groups]` section replaces the built-in groups.

#ifndef PJSK_CONFIG_CARD_CONFIG_HPP
#define PJSK_CONFIG_CARD_CONFIG_HPP

#include "card/alias_table.hpp"
#include "card/catalog.hpp"
#include "card/render_config.hpp"
#include "common.hpp"
#include "render/render_coordinator.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pjsk::config {

namespace fs = std::filesystem;

/// A configuration file that could not be read, parsed or accepted.
struct ConfigError {
    std::string message;

    [[nodiscard]] auto to_string() const -> std::string {
        return message;
    }
};

struct MessagingSettings {
    bool show_success_messages = true;
    bool mention_user_on_render = false;
    double selection_timeout_seconds = 30.0;
};

struct RenderSettings {
    bool adaptive_text_sizing = true;
    double default_curve_intensity = 0.5;
    bool enable_text_shadow = true;
    std::string default_emoji_set = "apple";
};

struct PersistenceSettings {
    bool enabled = true;
    double state_ttl_hours = 24.0;
    std::string storage_path = "data/pjsk_states.json";
};

struct LoggingSettings {
    std::string level = "warn";
    /// Empty means stderr only.
    std::string file;
};

/// Everything the host reads at startup.
struct CardConfig {
    MessagingSettings messaging;
    RenderSettings render;
    PersistenceSettings persistence;
    LoggingSettings logging;
    card::CardLimits limits;
    card::CardDefaults defaults;
    std::vector<card::PersonaEntry> personas = card::PersonaCatalog::builtin_personas();
    std::vector<card::PersonaGroup> groups = card::PersonaCatalog::builtin_groups();

    /// Parses TOML text; keys that are absent keep their defaults.
    [[nodiscard]] static auto parse(const std::string& content) -> Result<CardConfig, ConfigError>;

    /// Reads and validates a configuration file.
    ///
    /// # Returns
    ///
    /// The configuration, or an error naming the file and the problem.
    [[nodiscard]] static auto load(const fs::path& path) -> Result<CardConfig, ConfigError>;

    /// Like `load`, but logs the problem and returns the defaults instead.
    [[nodiscard]] static auto load_or_default(const fs::path& path) -> CardConfig;

    /// Rejects inverted bounds, non-positive steps, defaults outside their
    /// bounds, an empty persona set, and a default persona not in the set.
    [[nodiscard]] auto validate() const -> std::optional<ConfigError>;

    /// Builds the persona catalog, failing on an ambiguous alias.
    [[nodiscard]] auto build_catalog() const -> Result<card::PersonaCatalog, card::AliasConflict>;

    /// The subset the coordinator reads on every command.
    [[nodiscard]] auto coordinator_settings() const -> render::CoordinatorSettings;
};

} // namespace pjsk::config

#endif // PJSK_CONFIG_CARD_CONFIG_HPP

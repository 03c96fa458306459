//! # Render Configuration
//!
//! The mutable per-session card state and the bounds that constrain it.
//!
//! ## Invariants
//!
//! - `font_size`, `line_spacing`, `offset_x` and `offset_y` are always inside
//!   their `CardLimits` range; every mutation clamps.
//! - `line_spacing` is stored rounded to 2 decimals.
//! - `text` is never empty once set through the interpreter.

#ifndef PJSK_CARD_RENDER_CONFIG_HPP
#define PJSK_CARD_RENDER_CONFIG_HPP

#include "json/json_value.hpp"

#include <optional>
#include <string>

namespace pjsk::card {

// ============================================================================
// Bounds and Defaults
// ============================================================================

/// Bounds, step sizes and the text length limit.
struct CardLimits {
    int font_size_min = 18;
    int font_size_max = 84;
    int font_size_step = 4;

    double line_spacing_min = 0.60;
    double line_spacing_max = 3.00;
    double line_spacing_step = 0.10;

    int offset_min = -240;
    int offset_max = 240;
    int offset_step = 12;

    /// Maximum text length in code points.
    size_t max_text_length = 120;

    /// Returns a description of the first inconsistency, if any.
    [[nodiscard]] auto validate() const -> std::optional<std::string>;

    [[nodiscard]] auto clamp_font_size(long long value) const -> int;
    [[nodiscard]] auto clamp_line_spacing(double value) const -> double;
    [[nodiscard]] auto clamp_offset(long long value) const -> int;
};

/// Values used for a freshly created card.
struct CardDefaults {
    std::string text = "这是一个新的卡面";
    int font_size = 42;
    double line_spacing = 1.20;
    std::string role = "初音未来";
};

// ============================================================================
// RenderConfig
// ============================================================================

/// The seven-field card state.
struct RenderConfig {
    std::string text;
    int font_size = 42;
    double line_spacing = 1.20;
    bool curve_enabled = false;
    int offset_x = 0;
    int offset_y = 0;
    std::string role;

    /// A fresh card: defaults clamped into `limits`, curve off, centred.
    [[nodiscard]] static auto make_default(const CardDefaults& defaults, const CardLimits& limits)
        -> RenderConfig;

    /// Snapshot as a JSON object with the seven field names as keys.
    [[nodiscard]] auto to_json() const -> json::JsonValue;

    /// Reads a snapshot written by `to_json`. Returns `nullopt` when a field
    /// is missing or has the wrong type.
    [[nodiscard]] static auto from_json(const json::JsonValue& value) -> std::optional<RenderConfig>;

    [[nodiscard]] auto operator==(const RenderConfig& other) const -> bool;
};

/// Rounds to 2 decimals, half away from zero.
[[nodiscard]] auto round_spacing(double value) -> double;

/// Spacing values closer than 1e-6 are the same value.
[[nodiscard]] auto spacing_equal(double a, double b) -> bool;

/// Formats a spacing with exactly 2 decimals ("1.20").
[[nodiscard]] auto format_spacing(double value) -> std::string;

} // namespace pjsk::card

#endif // PJSK_CARD_RENDER_CONFIG_HPP

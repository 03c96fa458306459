//! # Text Layout Heuristics
//!
//! Approximate text metrics used before the renderer is involved. A glyph
//! is assumed to be 0.6 × the font size wide; lines are separated by '\n'.

#ifndef PJSK_CARD_LAYOUT_HPP
#define PJSK_CARD_LAYOUT_HPP

#include <string>
#include <string_view>

namespace pjsk::card {

/// Card height used for vertical centring.
inline constexpr int CARD_HEIGHT = 600;

/// Target width for adaptive font sizing.
inline constexpr int ADAPTIVE_TARGET_WIDTH = 400;

/// Estimated glyph width as a fraction of the font size.
inline constexpr double GLYPH_WIDTH_RATIO = 0.6;

struct TextDimensions {
    int width = 0;
    int height = 0;
};

struct TextOffsets {
    int x = 0;
    int y = 0;
};

/// Longest non-blank line (by code points); empty if there is none.
[[nodiscard]] auto find_longest_line(std::string_view text) -> std::string;

/// Estimated rendered size of `text`.
[[nodiscard]] auto calculate_text_dimensions(std::string_view text, int font_size,
                                             double line_spacing) -> TextDimensions;

/// Largest font size in `[min_size, max_size]` whose longest line fits
/// `target_width`; `max_size` for empty text.
[[nodiscard]] auto calculate_font_size(std::string_view text, int target_width, int min_size,
                                       int max_size) -> int;

/// Suggested offsets: x = font/4, y centres the text block on the card,
/// clamped to ±240.
[[nodiscard]] auto calculate_offsets(std::string_view text, int font_size, double line_spacing)
    -> TextOffsets;

/// Clamps a curve intensity into [0, 1].
[[nodiscard]] auto clamp_curve_intensity(double intensity) -> double;

} // namespace pjsk::card

#endif // PJSK_CARD_LAYOUT_HPP

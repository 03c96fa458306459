//! # Text Utilities
//!
//! UTF-8 aware helpers shared by the tokenizer, the interpreter and the
//! layout heuristics. Whitespace means ASCII whitespace plus U+3000
//! (ideographic space), which chat clients emit for full-width input.

#ifndef PJSK_CARD_TEXT_UTILS_HPP
#define PJSK_CARD_TEXT_UTILS_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pjsk::card {

/// Byte length of the whitespace sequence starting at `pos` (0 if none).
[[nodiscard]] auto whitespace_at(std::string_view s, size_t pos) -> size_t;

/// Removes leading and trailing whitespace.
[[nodiscard]] auto trim(std::string_view s) -> std::string;

/// Lower-cases ASCII letters; other bytes are left untouched.
[[nodiscard]] auto to_lower_ascii(std::string_view s) -> std::string;

/// Upper-cases ASCII letters; other bytes are left untouched.
[[nodiscard]] auto to_upper_ascii(std::string_view s) -> std::string;

/// Splits on runs of whitespace; empty for blank input.
[[nodiscard]] auto split_whitespace(std::string_view s) -> std::vector<std::string>;

/// Number of UTF-8 code points in `s`.
[[nodiscard]] auto utf8_length(std::string_view s) -> size_t;

/// The first `max_chars` code points of `s`.
[[nodiscard]] auto utf8_truncate(std::string_view s, size_t max_chars) -> std::string;

/// Trims and collapses every whitespace run to a single ASCII space.
[[nodiscard]] auto collapse_whitespace(std::string_view s) -> std::string;

/// Collapses whitespace, then truncates to `max_chars` code points ending in
/// "..." when the text is longer.
[[nodiscard]] auto sanitize_text(std::string_view s, size_t max_chars) -> std::string;

} // namespace pjsk::card

#endif // PJSK_CARD_TEXT_UTILS_HPP

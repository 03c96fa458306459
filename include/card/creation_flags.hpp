//! # Creation Flags
//!
//! One-shot card creation in flag style:
//!
//! ```text
//! -n "text" -s 48 -l 1.8 -c -x 12 -y -6 -r miku --daf
//! ```
//!
//! `-n`, `-x`, `-y`, `-s`, `-l` and `-r` take a value; `-c` and `--daf` are
//! bare. Unknown tokens are skipped, a flag with no value left is skipped,
//! and a numeric value that does not parse is ignored.

#ifndef PJSK_CARD_CREATION_FLAGS_HPP
#define PJSK_CARD_CREATION_FLAGS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pjsk::card {

/// Flags parsed from a creation command. Absent flags stay `nullopt`.
struct CreationFlags {
    std::optional<std::string> text;
    std::optional<long long> offset_x;
    std::optional<long long> offset_y;
    std::optional<std::string> role;
    std::optional<long long> font_size;
    std::optional<double> line_spacing;
    bool curve = false;
    bool default_font = false;

    /// True if `-r` named the random-selection marker.
    [[nodiscard]] auto random_role() const -> bool;

    [[nodiscard]] auto empty() const -> bool {
        return !text && !offset_x && !offset_y && !role && !font_size && !line_spacing &&
               !curve && !default_font;
    }
};

/// Parses flag-style arguments (already split by `split_args`).
[[nodiscard]] auto parse_creation_flags(const std::vector<std::string>& args) -> CreationFlags;

/// True if the message should be read as creation flags rather than free
/// text: its first token is one of the recognized flags.
[[nodiscard]] auto is_flag_style(std::string_view message) -> bool;

/// True for the `-r` values that request a random persona.
[[nodiscard]] auto is_random_marker(std::string_view value) -> bool;

} // namespace pjsk::card

#endif // PJSK_CARD_CREATION_FLAGS_HPP

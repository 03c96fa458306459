//! # Replies
//!
//! Text formatting for everything the coordinator sends back: state
//! summaries, usage guidance, error replies and quick-action buttons.
//!
//! Hosts without interactive components receive buttons as text:
//!
//! ```text
//! 【Quick adjust】
//!
//! 🔠 字号 ↑ ｜ 🔠 字号 ↓
//! ```

#ifndef PJSK_RENDER_REPLY_HPP
#define PJSK_RENDER_REPLY_HPP

#include "card/render_config.hpp"
#include "render/renderer.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pjsk::render {

/// One quick-reply button: what it shows and the command it sends.
struct Button {
    std::string label;
    std::string command;
    std::string emoji;
};

/// Buttons laid out in rows under an optional title.
struct ButtonMatrix {
    std::string title;
    std::vector<std::vector<Button>> rows;

    /// All buttons, row by row.
    [[nodiscard]] auto flatten() const -> std::vector<Button>;
};

/// Font size, spacing, position and curve shortcuts.
[[nodiscard]] auto adjustment_buttons() -> ButtonMatrix;

/// Shortcuts for the persona listings.
[[nodiscard]] auto list_buttons() -> ButtonMatrix;

/// Encodes a button matrix as plain text: the title in 【】, a blank line,
/// then one line per row with buttons separated by " ｜ ".
[[nodiscard]] auto encode_button_text(const ButtonMatrix& buttons) -> std::string;

inline constexpr const char* QUICK_ACTION_LINE =
    "Quick actions: /pjsk.调整 字号.大 ｜ 字号.小 ｜ 行距.大 ｜ 行距.小 ｜ 位置.上 ｜ 位置.下 ｜ "
    "位置.左 ｜ 位置.右 ｜ 曲线 切换";

/// The six state lines of a card summary.
[[nodiscard]] auto format_state_lines(const card::RenderConfig& config)
    -> std::vector<std::string>;

/// Headline, blank line, state lines, blank line, quick-action line.
[[nodiscard]] auto format_summary(const card::RenderConfig& config, std::string_view headline)
    -> std::string;

/// Usage of the adjust command, sent when it is called without arguments.
[[nodiscard]] auto format_guidance() -> std::string;

/// Error line with a remedy and the quick-action line.
[[nodiscard]] auto format_error(std::string_view message) -> std::string;

/// Prefixes `text` with "@name ". An empty name leaves the text unchanged.
[[nodiscard]] auto with_mention(std::string_view text, std::string_view name) -> std::string;

/// A reply produced by one command.
struct Reply {
    std::string text;
    ImageBytes image;
    bool is_error = false;
    std::optional<ButtonMatrix> buttons;

    static auto ok(std::string text) -> Reply {
        return Reply{std::move(text), {}, false, std::nullopt};
    }

    static auto error(std::string_view message) -> Reply {
        return Reply{format_error(message), {}, true, std::nullopt};
    }

    /// Flattens text, an image marker and encoded buttons into one message.
    [[nodiscard]] auto to_plain_text() const -> std::string;
};

} // namespace pjsk::render

#endif // PJSK_RENDER_REPLY_HPP

#include "render/reply.hpp"

#include <sstream>

namespace pjsk::render {

auto ButtonMatrix::flatten() const -> std::vector<Button> {
    std::vector<Button> result;
    for (const auto& row : rows) {
        result.insert(result.end(), row.begin(), row.end());
    }
    return result;
}

auto adjustment_buttons() -> ButtonMatrix {
    return ButtonMatrix{
        "Quick adjust",
        {
            {
                {"字号 ↑", "/pjsk.调整 字号.大", "🔠"},
                {"字号 ↓", "/pjsk.调整 字号.小", "🔠"},
            },
            {
                {"行距 ↑", "/pjsk.调整 行距.大", "📏"},
                {"行距 ↓", "/pjsk.调整 行距.小", "📏"},
            },
            {
                {"位置 ↑", "/pjsk.调整 位置.上", "📍"},
                {"位置 ↓", "/pjsk.调整 位置.下", "📍"},
                {"位置 ←", "/pjsk.调整 位置.左", "📍"},
                {"位置 →", "/pjsk.调整 位置.右", "📍"},
            },
            {
                {"曲线", "/pjsk.调整 曲线 切换", "〰️"},
            },
        },
    };
}

auto list_buttons() -> ButtonMatrix {
    return ButtonMatrix{
        "Browse personas",
        {
            {
                {"全部角色", "/pjsk.列表.全部", "📋"},
                {"按组分类", "/pjsk.列表.角色分类", "🎭"},
            },
        },
    };
}

auto encode_button_text(const ButtonMatrix& buttons) -> std::string {
    std::ostringstream out;
    bool first_line = true;
    if (!buttons.title.empty()) {
        out << "【" << buttons.title << "】\n";
        first_line = false;
    }
    for (const auto& row : buttons.rows) {
        if (!first_line) {
            out << "\n";
        }
        first_line = false;
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) {
                out << " ｜ ";
            }
            if (!row[i].emoji.empty()) {
                out << row[i].emoji << " ";
            }
            out << row[i].label;
        }
    }
    return out.str();
}

// ============================================================================
// Text Replies
// ============================================================================

auto format_state_lines(const card::RenderConfig& config) -> std::vector<std::string> {
    return {
        "Text: " + config.text,
        "Font size: " + std::to_string(config.font_size) + "px",
        "Line spacing: " + card::format_spacing(config.line_spacing),
        std::string("Curve: ") + (config.curve_enabled ? "on" : "off"),
        "Position: X " + std::to_string(config.offset_x) + " / Y " +
            std::to_string(config.offset_y),
        "Persona: " + config.role,
    };
}

auto format_summary(const card::RenderConfig& config, std::string_view headline) -> std::string {
    std::ostringstream out;
    out << headline << "\n\n";
    for (const auto& line : format_state_lines(config)) {
        out << line << "\n";
    }
    out << "\n" << QUICK_ACTION_LINE;
    return out.str();
}

auto format_guidance() -> std::string {
    std::ostringstream out;
    out << "pjsk.调整 usage:\n"
        << "• 文本 <content> - update the displayed text.\n"
        << "• 字号 <value> - set the font size; 字号.大 / 字号.小 step it.\n"
        << "• 行距 <value> - set the line spacing; 行距.大 / 行距.小 step it.\n"
        << "• 曲线 [开|关|切换] - switch the curved text effect.\n"
        << "• 位置.<上|下|左|右> [step] - move the text.\n"
        << "• 人物 <name> - switch persona; 人物 -r picks one at random.\n"
        << "\n"
        << "Arguments go directly after the command.\n"
        << "\n"
        << QUICK_ACTION_LINE;
    return out.str();
}

auto format_error(std::string_view message) -> std::string {
    std::ostringstream out;
    out << "⚠️ " << message << "\n\n"
        << "Send /pjsk.draw to create or refresh the card, or /pjsk.调整 for command help.\n\n"
        << QUICK_ACTION_LINE;
    return out.str();
}

auto with_mention(std::string_view text, std::string_view name) -> std::string {
    if (name.empty()) {
        return std::string(text);
    }
    std::string result = "@";
    result += name;
    result += " ";
    result += text;
    return result;
}

auto Reply::to_plain_text() const -> std::string {
    std::string result = text;
    if (!image.empty()) {
        if (!result.empty()) {
            result += "\n";
        }
        result += "[Image: " + std::to_string(image.size()) + " bytes]";
    }
    if (buttons) {
        if (!result.empty()) {
            result += "\n\n";
        }
        result += encode_button_text(*buttons);
    }
    return result;
}

} // namespace pjsk::render

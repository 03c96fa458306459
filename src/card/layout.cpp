#include "card/layout.hpp"

#include "card/text_utils.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace pjsk::card {

namespace {

auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

} // namespace

auto find_longest_line(std::string_view text) -> std::string {
    std::string_view longest;
    size_t longest_len = 0;
    bool found = false;
    for (auto line : split_lines(text)) {
        if (trim(line).empty()) {
            continue;
        }
        size_t len = utf8_length(line);
        if (!found || len > longest_len) {
            longest = line;
            longest_len = len;
            found = true;
        }
    }
    return std::string(longest);
}

auto calculate_text_dimensions(std::string_view text, int font_size, double line_spacing)
    -> TextDimensions {
    if (text.empty()) {
        return {};
    }
    auto line_count = static_cast<double>(split_lines(text).size());
    auto longest = static_cast<double>(utf8_length(find_longest_line(text)));

    TextDimensions dims;
    dims.width = static_cast<int>(longest * font_size * GLYPH_WIDTH_RATIO);
    dims.height = static_cast<int>(line_count * font_size * line_spacing);
    return dims;
}

auto calculate_font_size(std::string_view text, int target_width, int min_size, int max_size)
    -> int {
    if (text.empty()) {
        return max_size;
    }
    double estimated =
        static_cast<double>(utf8_length(find_longest_line(text))) * GLYPH_WIDTH_RATIO * max_size;
    if (estimated <= target_width) {
        return max_size;
    }
    int scaled = static_cast<int>(max_size * (target_width / estimated));
    return std::clamp(scaled, min_size, max_size);
}

auto calculate_offsets(std::string_view text, int font_size, double line_spacing) -> TextOffsets {
    auto line_count = static_cast<int>(split_lines(text).size());
    int line_height = static_cast<int>(font_size * line_spacing);
    int total_height = line_height * line_count;

    TextOffsets offsets;
    offsets.x = font_size / 4;
    // Floor division so odd remainders round toward the top
    offsets.y = static_cast<int>(std::floor((CARD_HEIGHT - total_height) / 2.0));
    offsets.y = std::clamp(offsets.y, -240, 240);
    return offsets;
}

auto clamp_curve_intensity(double intensity) -> double {
    return std::clamp(intensity, 0.0, 1.0);
}

} // namespace pjsk::card

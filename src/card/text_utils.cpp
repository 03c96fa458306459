#include "card/text_utils.hpp"

namespace pjsk::card {

namespace {

constexpr std::string_view IDEOGRAPHIC_SPACE = "\xE3\x80\x80";

auto is_continuation(unsigned char c) -> bool {
    return (c & 0xC0) == 0x80;
}

} // namespace

auto whitespace_at(std::string_view s, size_t pos) -> size_t {
    if (pos >= s.size()) {
        return 0;
    }
    char c = s[pos];
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
        return 1;
    }
    if (s.substr(pos, IDEOGRAPHIC_SPACE.size()) == IDEOGRAPHIC_SPACE) {
        return IDEOGRAPHIC_SPACE.size();
    }
    return 0;
}

auto trim(std::string_view s) -> std::string {
    size_t start = 0;
    while (size_t n = whitespace_at(s, start)) {
        start += n;
    }

    size_t end = s.size();
    while (end > start) {
        if (whitespace_at(s, end - 1) == 1) {
            --end;
        } else if (end - start >= IDEOGRAPHIC_SPACE.size() &&
                   s.substr(end - IDEOGRAPHIC_SPACE.size(), IDEOGRAPHIC_SPACE.size()) ==
                       IDEOGRAPHIC_SPACE) {
            end -= IDEOGRAPHIC_SPACE.size();
        } else {
            break;
        }
    }
    return std::string(s.substr(start, end - start));
}

auto to_lower_ascii(std::string_view s) -> std::string {
    std::string out(s);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

auto to_upper_ascii(std::string_view s) -> std::string {
    std::string out(s);
    for (char& c : out) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 'a' + 'A');
        }
    }
    return out;
}

auto split_whitespace(std::string_view s) -> std::vector<std::string> {
    std::vector<std::string> parts;
    std::string current;
    size_t pos = 0;
    while (pos < s.size()) {
        if (size_t n = whitespace_at(s, pos)) {
            if (!current.empty()) {
                parts.push_back(std::move(current));
                current.clear();
            }
            pos += n;
        } else {
            current += s[pos++];
        }
    }
    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

auto utf8_length(std::string_view s) -> size_t {
    size_t count = 0;
    for (char c : s) {
        if (!is_continuation(static_cast<unsigned char>(c))) {
            ++count;
        }
    }
    return count;
}

auto utf8_truncate(std::string_view s, size_t max_chars) -> std::string {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!is_continuation(static_cast<unsigned char>(s[i]))) {
            if (seen == max_chars) {
                return std::string(s.substr(0, i));
            }
            ++seen;
        }
    }
    return std::string(s);
}

auto collapse_whitespace(std::string_view s) -> std::string {
    std::string out;
    for (const auto& part : split_whitespace(s)) {
        if (!out.empty()) {
            out += ' ';
        }
        out += part;
    }
    return out;
}

auto sanitize_text(std::string_view s, size_t max_chars) -> std::string {
    std::string collapsed = collapse_whitespace(s);
    if (utf8_length(collapsed) <= max_chars) {
        return collapsed;
    }
    if (max_chars <= 3) {
        return utf8_truncate(collapsed, max_chars);
    }
    return utf8_truncate(collapsed, max_chars - 3) + "...";
}

} // namespace pjsk::card

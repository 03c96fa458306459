#include "card/tokenizer.hpp"

#include "card/text_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iterator>

namespace pjsk::card {

namespace {

struct QuotePair {
    std::string_view open;
    std::string_view close;
};

constexpr QuotePair QUOTES[] = {
    {"\"", "\""},
    {"'", "'"},
    {"\xE2\x80\x9C", "\xE2\x80\x9D"}, // “ ”
};

void replace_all(std::string& s, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

/// strtod over the whole of `text`, restricted to plain decimal notation.
auto parse_decimal(const std::string& text) -> std::optional<double> {
    if (text.empty()) {
        return std::nullopt;
    }
    for (char c : text) {
        bool allowed = (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.' || c == 'e';
        if (!allowed) {
            return std::nullopt;
        }
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

constexpr double INT_SATURATION = 9.0e18;

auto parse_failure(std::string_view raw) -> AdjustError {
    return AdjustError::validation("could not parse number: " + std::string(raw));
}

} // namespace

auto extract_first_token(std::string_view message) -> FirstToken {
    std::string trimmed = trim(message);
    for (size_t pos = 0; pos < trimmed.size(); ++pos) {
        if (whitespace_at(trimmed, pos) > 0) {
            return {trimmed.substr(0, pos), trim(std::string_view(trimmed).substr(pos))};
        }
    }
    return {trimmed, ""};
}

auto split_dotted(std::string_view token) -> DottedToken {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= token.size()) {
        size_t dot = token.find('.', start);
        if (dot == std::string_view::npos) {
            dot = token.size();
        }
        if (dot > start) {
            segments.emplace_back(token.substr(start, dot - start));
        }
        start = dot + 1;
    }

    if (segments.empty()) {
        return {};
    }
    DottedToken result;
    result.head = std::move(segments.front());
    result.variants.assign(std::make_move_iterator(segments.begin() + 1),
                           std::make_move_iterator(segments.end()));
    return result;
}

auto split_args(std::string_view remainder) -> std::vector<std::string> {
    std::vector<std::string> args;
    std::string current;
    size_t pos = 0;

    while (pos < remainder.size()) {
        if (size_t n = whitespace_at(remainder, pos)) {
            if (!current.empty()) {
                args.push_back(std::move(current));
                current.clear();
            }
            pos += n;
            continue;
        }

        if (current.empty()) {
            bool quoted = false;
            for (const auto& quote : QUOTES) {
                if (remainder.substr(pos, quote.open.size()) != quote.open) {
                    continue;
                }
                size_t body = pos + quote.open.size();
                size_t close = remainder.find(quote.close, body);
                if (close == std::string_view::npos) {
                    break;
                }
                args.emplace_back(remainder.substr(body, close - body));
                pos = close + quote.close.size();
                quoted = true;
                break;
            }
            if (quoted) {
                continue;
            }
        }

        current += remainder[pos++];
    }

    if (!current.empty()) {
        args.push_back(std::move(current));
    }
    return args;
}

auto parse_int(std::string_view raw) -> Result<long long, AdjustError> {
    std::string sanitized = to_lower_ascii(trim(raw));
    replace_all(sanitized, "px", "");
    replace_all(sanitized, "\xEF\xBC\x8B", "+"); // ＋
    replace_all(sanitized, "\xEF\xBC\x8D", "-"); // －

    auto value = parse_decimal(sanitized);
    if (!value) {
        return parse_failure(raw);
    }
    // Saturate so oversized but well-formed input still reaches the clamp
    double saturated = std::clamp(*value, -INT_SATURATION, INT_SATURATION);
    return static_cast<long long>(std::trunc(saturated));
}

auto parse_positive_int(std::string_view raw) -> Result<long long, AdjustError> {
    auto value = parse_int(raw);
    if (is_err(value)) {
        return value;
    }
    if (unwrap(value) <= 0) {
        return AdjustError::validation("step must be a positive integer: " + std::string(raw));
    }
    return value;
}

auto parse_float(std::string_view raw) -> Result<double, AdjustError> {
    std::string sanitized = to_lower_ascii(trim(raw));
    replace_all(sanitized, "倍", "");
    replace_all(sanitized, "x", "");
    replace_all(sanitized, ",", ".");

    auto value = parse_decimal(sanitized);
    if (!value) {
        return parse_failure(raw);
    }
    return *value;
}

} // namespace pjsk::card

//! # JSON Parser Implementation
//!
//! Recursive descent over the raw input. Numbers without a fraction or
//! exponent become `Int64` when they fit; `\uXXXX` escapes (including
//! surrogate pairs) are decoded to UTF-8.

#include "json/json_parser.hpp"

#include <cerrno>
#include <cstdlib>

namespace pjsk::json {

namespace {

constexpr size_t MAX_DEPTH = 256;

void append_utf8(uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

} // namespace

JsonParser::JsonParser(std::string_view input) : input_(input) {}

auto JsonParser::advance() -> char {
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonParser::skip_whitespace() {
    while (!at_end()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonParser::error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_, pos_);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    // UTF-8 byte order mark
    if (input_.starts_with("\xEF\xBB\xBF")) {
        pos_ = 3;
    }

    skip_whitespace();
    if (at_end()) {
        return error("Empty document");
    }

    auto value = parse_value();
    if (is_err(value)) {
        return value;
    }

    skip_whitespace();
    if (!at_end()) {
        return error("Unexpected trailing content");
    }
    return value;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    if (at_end()) {
        return error("Unexpected end of input");
    }

    char c = peek();
    switch (c) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto str = parse_string();
        if (is_err(str)) {
            return unwrap_err(str);
        }
        return JsonValue(std::move(unwrap(str)));
    }
    case 't':
    case 'f':
    case 'n':
        return parse_keyword();
    default:
        if (c == '-' || is_digit(c)) {
            return parse_number();
        }
        return error(std::string("Unexpected character '") + c + "'");
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return error("Nesting too deep");
    }
    advance(); // {

    JsonObject obj;
    skip_whitespace();
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return error("Expected string key");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }

        skip_whitespace();
        if (peek() != ':') {
            return error("Expected ':' after key");
        }
        advance();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj.insert_or_assign(std::move(unwrap(key)), std::move(unwrap(value)));

        skip_whitespace();
        if (peek() == ',') {
            advance();
            continue;
        }
        if (peek() == '}') {
            advance();
            break;
        }
        return error("Expected ',' or '}' in object");
    }

    --depth_;
    return JsonValue(std::move(obj));
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return error("Nesting too deep");
    }
    advance(); // [

    JsonArray arr;
    skip_whitespace();
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        if (peek() == ',') {
            advance();
            continue;
        }
        if (peek() == ']') {
            advance();
            break;
        }
        return error("Expected ',' or ']' in array");
    }

    --depth_;
    return JsonValue(std::move(arr));
}

auto JsonParser::parse_hex4() -> Result<uint32_t, JsonError> {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        if (at_end()) {
            return error("Truncated \\u escape");
        }
        char c = advance();
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= static_cast<uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value |= static_cast<uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            value |= static_cast<uint32_t>(c - 'A' + 10);
        } else {
            return error("Invalid hex digit in \\u escape");
        }
    }
    return value;
}

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    advance(); // opening quote

    std::string out;
    while (true) {
        if (at_end()) {
            return error("Unterminated string");
        }
        char c = advance();
        if (c == '"') {
            break;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return error("Control character in string");
        }
        if (c != '\\') {
            out += c;
            continue;
        }

        if (at_end()) {
            return error("Unterminated escape sequence");
        }
        char esc = advance();
        switch (esc) {
        case '"':
            out += '"';
            break;
        case '\\':
            out += '\\';
            break;
        case '/':
            out += '/';
            break;
        case 'b':
            out += '\b';
            break;
        case 'f':
            out += '\f';
            break;
        case 'n':
            out += '\n';
            break;
        case 'r':
            out += '\r';
            break;
        case 't':
            out += '\t';
            break;
        case 'u': {
            auto hi = parse_hex4();
            if (is_err(hi)) {
                return unwrap_err(hi);
            }
            uint32_t cp = unwrap(hi);
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                if (peek() != '\\') {
                    return error("Unpaired high surrogate");
                }
                advance();
                if (peek() != 'u') {
                    return error("Unpaired high surrogate");
                }
                advance();
                auto lo = parse_hex4();
                if (is_err(lo)) {
                    return unwrap_err(lo);
                }
                uint32_t low = unwrap(lo);
                if (low < 0xDC00 || low > 0xDFFF) {
                    return error("Invalid low surrogate");
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                return error("Unpaired low surrogate");
            }
            append_utf8(cp, out);
            break;
        }
        default:
            return error(std::string("Invalid escape '\\") + esc + "'");
        }
    }
    return out;
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }
    if (!is_digit(peek())) {
        return error("Expected digit");
    }
    if (peek() == '0') {
        advance();
        if (is_digit(peek())) {
            return error("Leading zeros are not allowed");
        }
    } else {
        while (is_digit(peek())) {
            advance();
        }
    }
    if (peek() == '.') {
        is_float = true;
        advance();
        if (!is_digit(peek())) {
            return error("Expected digit after decimal point");
        }
        while (is_digit(peek())) {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!is_digit(peek())) {
            return error("Expected digit in exponent");
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    std::string text(input_.substr(start, pos_ - start));
    if (!is_float) {
        errno = 0;
        long long v = std::strtoll(text.c_str(), nullptr, 10);
        if (errno != ERANGE) {
            return JsonValue(static_cast<int64_t>(v));
        }
    }
    return JsonValue(std::strtod(text.c_str(), nullptr));
}

auto JsonParser::parse_keyword() -> Result<JsonValue, JsonError> {
    auto rest = input_.substr(pos_);
    auto consume = [this](size_t n) {
        for (size_t i = 0; i < n; ++i) {
            advance();
        }
    };
    if (rest.starts_with("true")) {
        consume(4);
        return JsonValue(true);
    }
    if (rest.starts_with("false")) {
        consume(5);
        return JsonValue(false);
    }
    if (rest.starts_with("null")) {
        consume(4);
        return JsonValue();
    }
    return error("Invalid literal");
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace pjsk::json

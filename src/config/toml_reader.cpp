#include "config/toml_reader.hpp"

#include <cctype>
#include <cstdlib>

namespace pjsk::config {

namespace {

auto is_identifier_char(char c) -> bool {
    auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '-';
}

} // namespace

auto toml_type_name(const TomlValue& value) -> const char* {
    switch (value.index()) {
    case 0:
        return "string";
    case 1:
        return "integer";
    case 2:
        return "float";
    case 3:
        return "boolean";
    case 4:
        return "array";
    }
    return "unknown";
}

auto TomlTable::find(std::string_view key) const -> const TomlEntry* {
    for (const auto& entry : entries) {
        if (entry.key == key) {
            return &entry;
        }
    }
    return nullptr;
}

auto TomlDocument::table(std::string_view name) const -> const TomlTable* {
    for (const auto& t : tables) {
        if (t.name == name) {
            return &t;
        }
    }
    return nullptr;
}

// ============================================================================
// SimpleTomlParser
// ============================================================================

SimpleTomlParser::SimpleTomlParser(std::string content) : content_(std::move(content)) {}

void SimpleTomlParser::skip_whitespace() {
    while (!is_eof() && std::isspace(static_cast<unsigned char>(peek()))) {
        if (peek() == '\n')
            line_++;
        advance();
    }
}

void SimpleTomlParser::skip_inline_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t')) {
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

auto SimpleTomlParser::advance() -> char {
    if (is_eof())
        return '\0';
    return content_[pos_++];
}

auto SimpleTomlParser::parse_identifier() -> std::string {
    std::string result;
    while (!is_eof() && is_identifier_char(peek())) {
        result += advance();
    }
    return result;
}

auto SimpleTomlParser::parse_key() -> std::optional<std::string> {
    if (peek() == '"') {
        return parse_string();
    }
    std::string key = parse_identifier();
    if (key.empty()) {
        set_error("Expected key");
        return std::nullopt;
    }
    return key;
}

auto SimpleTomlParser::parse_string() -> std::optional<std::string> {
    if (peek() != '"') {
        set_error("Expected string");
        return std::nullopt;
    }
    advance(); // Skip opening quote

    std::string result;
    while (!is_eof() && peek() != '"' && peek() != '\n') {
        if (peek() == '\\') {
            advance();
            if (is_eof())
                break;
            char escaped = advance();
            switch (escaped) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            case 'r':
                result += '\r';
                break;
            case '\\':
                result += '\\';
                break;
            case '"':
                result += '"';
                break;
            default:
                result += escaped;
                break;
            }
        } else {
            result += advance();
        }
    }

    if (peek() != '"') {
        set_error("Unterminated string");
        return std::nullopt;
    }
    advance(); // Skip closing quote

    return result;
}

auto SimpleTomlParser::parse_number() -> std::optional<TomlValue> {
    std::string num_str;
    if (peek() == '-' || peek() == '+') {
        num_str += advance();
    }
    bool is_float = false;
    while (!is_eof()) {
        char c = peek();
        if (std::isdigit(static_cast<unsigned char>(c))) {
            num_str += advance();
        } else if (c == '_') {
            advance();
        } else if (c == '.' || c == 'e' || c == 'E') {
            is_float = true;
            num_str += advance();
            if ((c == 'e' || c == 'E') && (peek() == '-' || peek() == '+')) {
                num_str += advance();
            }
        } else {
            break;
        }
    }

    const char* begin = num_str.c_str();
    char* end = nullptr;
    if (is_float) {
        double value = std::strtod(begin, &end);
        if (num_str.empty() || *end != '\0') {
            set_error("Invalid number '" + num_str + "'");
            return std::nullopt;
        }
        return TomlValue(value);
    }
    long long value = std::strtoll(begin, &end, 10);
    if (num_str.empty() || end == begin || *end != '\0') {
        set_error("Invalid number '" + num_str + "'");
        return std::nullopt;
    }
    return TomlValue(value);
}

auto SimpleTomlParser::parse_boolean() -> std::optional<bool> {
    std::string value = parse_identifier();
    if (value == "true")
        return true;
    if (value == "false")
        return false;
    set_error("Expected value, found '" + value + "'");
    return std::nullopt;
}

auto SimpleTomlParser::parse_string_array() -> std::optional<std::vector<std::string>> {
    std::vector<std::string> result;

    if (peek() != '[') {
        set_error("Expected array");
        return std::nullopt;
    }
    advance(); // Skip '['

    // Items may be separated by newlines and comments
    auto skip_blank = [this] {
        skip_whitespace();
        while (peek() == '#') {
            skip_comment();
            skip_whitespace();
        }
    };

    skip_blank();
    while (!is_eof() && peek() != ']') {
        auto item = parse_string();
        if (!item) {
            set_error("Arrays may only contain strings");
            return std::nullopt;
        }
        result.push_back(std::move(*item));

        skip_blank();
        if (peek() == ',') {
            advance();
            skip_blank();
        } else if (peek() != ']') {
            set_error("Expected ',' or ']' in array");
            return std::nullopt;
        }
    }

    if (peek() != ']') {
        set_error("Expected closing bracket");
        return std::nullopt;
    }
    advance(); // Skip ']'

    return result;
}

auto SimpleTomlParser::parse_value() -> std::optional<TomlValue> {
    char c = peek();
    if (c == '"') {
        auto s = parse_string();
        if (!s)
            return std::nullopt;
        return TomlValue(std::move(*s));
    }
    if (c == '[') {
        auto arr = parse_string_array();
        if (!arr)
            return std::nullopt;
        return TomlValue(std::move(*arr));
    }
    if (c == '-' || c == '+' || std::isdigit(static_cast<unsigned char>(c))) {
        return parse_number();
    }
    auto b = parse_boolean();
    if (!b)
        return std::nullopt;
    return TomlValue(*b);
}

auto SimpleTomlParser::parse_section_header() -> std::optional<std::string> {
    advance(); // Skip '['
    skip_inline_whitespace();
    auto name = parse_key();
    if (!name)
        return std::nullopt;
    skip_inline_whitespace();
    if (peek() != ']') {
        set_error("Expected ']' after section name");
        return std::nullopt;
    }
    advance(); // Skip ']'
    return name;
}

void SimpleTomlParser::set_error(const std::string& message) {
    if (error_message_.empty()) {
        error_message_ = "Line " + std::to_string(line_) + ": " + message;
    }
}

auto SimpleTomlParser::parse() -> std::optional<TomlDocument> {
    TomlDocument doc;
    doc.tables.push_back(TomlTable{"", {}});
    size_t current = 0;

    while (!is_eof()) {
        skip_whitespace();
        skip_comment();

        if (is_eof())
            break;
        if (std::isspace(static_cast<unsigned char>(peek())))
            continue;

        if (peek() == '[') {
            auto section = parse_section_header();
            if (!section)
                return std::nullopt;

            // Repeated headers extend the existing table
            current = doc.tables.size();
            for (size_t i = 0; i < doc.tables.size(); ++i) {
                if (doc.tables[i].name == *section) {
                    current = i;
                    break;
                }
            }
            if (current == doc.tables.size()) {
                doc.tables.push_back(TomlTable{*section, {}});
            }
            continue;
        }

        int key_line = line_;
        auto key = parse_key();
        if (!key)
            return std::nullopt;

        skip_inline_whitespace();
        if (peek() != '=') {
            set_error("Expected '=' after key");
            return std::nullopt;
        }
        advance();
        skip_inline_whitespace();

        auto value = parse_value();
        if (!value)
            return std::nullopt;

        skip_inline_whitespace();
        skip_comment();
        if (!is_eof() && peek() != '\n' && peek() != '\r') {
            set_error("Unexpected content after value");
            return std::nullopt;
        }

        auto& table = doc.tables[current];
        if (table.find(*key)) {
            set_error("Duplicate key '" + *key + "'");
            return std::nullopt;
        }
        table.entries.push_back(TomlEntry{std::move(*key), std::move(*value), key_line});
    }

    return doc;
}

} // namespace pjsk::config

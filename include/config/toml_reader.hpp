//! # TOML Reader
//!
//! A TOML subset, enough for `pjsk.toml`:
//!
//! - Sections: `[section]`
//! - Keys: bare (`font_size_min`) or quoted (`"Leo/need"`)
//! - Strings: `key = "value"` with `\n`, `\t`, `\\` and `\"` escapes
//! - Integers and floats: `key = 42`, `key = -1.5`
//! - Booleans: `key = true`
//! - String arrays: `key = ["a", "b"]`, which may span lines
//! - `#` comments
//!
//! Tables and keys keep file order, so persona listings follow the file.

#ifndef PJSK_CONFIG_TOML_READER_HPP
#define PJSK_CONFIG_TOML_READER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pjsk::config {

using TomlValue = std::variant<std::string, long long, double, bool, std::vector<std::string>>;

/// Human-readable name of the type a value holds ("string", "integer", ...).
[[nodiscard]] auto toml_type_name(const TomlValue& value) -> const char*;

struct TomlEntry {
    std::string key;
    TomlValue value;
    int line = 0;
};

/// One `[section]`, with its entries in file order.
struct TomlTable {
    std::string name;
    std::vector<TomlEntry> entries;

    [[nodiscard]] auto find(std::string_view key) const -> const TomlEntry*;
};

struct TomlDocument {
    /// Keys before the first section live in a table named "".
    std::vector<TomlTable> tables;

    [[nodiscard]] auto table(std::string_view name) const -> const TomlTable*;
};

class SimpleTomlParser {
public:
    explicit SimpleTomlParser(std::string content);

    /// Parses the whole document. Returns `nullopt` on the first error;
    /// `get_error()` then describes it with its line number.
    auto parse() -> std::optional<TomlDocument>;

    [[nodiscard]] auto get_error() const -> const std::string& {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    void skip_whitespace();
    void skip_inline_whitespace();
    void skip_comment();
    [[nodiscard]] auto is_eof() const -> bool {
        return pos_ >= content_.size();
    }
    [[nodiscard]] auto peek() const -> char {
        return is_eof() ? '\0' : content_[pos_];
    }
    auto advance() -> char;

    auto parse_identifier() -> std::string;
    auto parse_key() -> std::optional<std::string>;
    auto parse_string() -> std::optional<std::string>;
    auto parse_number() -> std::optional<TomlValue>;
    auto parse_boolean() -> std::optional<bool>;
    auto parse_string_array() -> std::optional<std::vector<std::string>>;
    auto parse_value() -> std::optional<TomlValue>;

    auto parse_section_header() -> std::optional<std::string>;

    void set_error(const std::string& message);
};

} // namespace pjsk::config

#endif // PJSK_CONFIG_TOML_READER_HPP

//! # JSON Parser
//!
//! A recursive-descent reader for RFC 8259 documents. Errors carry the line
//! and column of the offending character.

#ifndef PJSK_JSON_PARSER_HPP
#define PJSK_JSON_PARSER_HPP

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>

namespace pjsk::json {

/// Parser over a single in-memory document.
class JsonParser {
public:
    explicit JsonParser(std::string_view input);

    /// Parses the whole input; trailing non-whitespace is an error.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }
    [[nodiscard]] auto peek() const -> char {
        return at_end() ? '\0' : input_[pos_];
    }
    auto advance() -> char;
    void skip_whitespace();
    auto error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
    auto parse_keyword() -> Result<JsonValue, JsonError>;
    auto parse_hex4() -> Result<uint32_t, JsonError>;
};

/// Parses a JSON document.
///
/// # Example
///
/// ```cpp
/// auto result = parse_json(R"({"states": {}})");
/// if (is_ok(result)) {
///     auto& doc = unwrap(result);
/// }
/// ```
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace pjsk::json

#endif // PJSK_JSON_PARSER_HPP

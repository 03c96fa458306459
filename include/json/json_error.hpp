//! # JSON Error Types
//!
//! Parse errors with line/column information for the store document reader.

#ifndef PJSK_JSON_ERROR_HPP
#define PJSK_JSON_ERROR_HPP

#include <cstddef>
#include <string>

namespace pjsk::json {

/// An error encountered while parsing a JSON document.
///
/// # Fields
///
/// - `message`: Description of what went wrong
/// - `line`: 1-based line number (0 if unknown)
/// - `column`: 1-based column number (0 if unknown)
/// - `offset`: Byte offset from start of input
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    /// Creates an error with message only.
    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    /// Creates an error with location information.
    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// Formats as `"line X, column Y: message"`, or just the message when
    /// the location is unknown.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace pjsk::json

#endif // PJSK_JSON_ERROR_HPP

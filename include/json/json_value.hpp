//! # JSON Value Types
//!
//! `JsonNumber` keeps integers and doubles apart so that a font size written
//! as `42` reads back as an integer while a line spacing of `1.2` stays a
//! double. `JsonValue` is a move-only variant over the six JSON kinds; use
//! `clone()` for an explicit deep copy.
//!
//! ## Example
//!
//! ```cpp
//! JsonValue entry(JsonObject{});
//! entry.set("timestamp", JsonValue(1718000000.5));
//! if (auto* ts = entry.get("timestamp"); ts && ts->is_number()) {
//!     double saved_at = ts->as_f64();
//! }
//! ```

#ifndef PJSK_JSON_VALUE_HPP
#define PJSK_JSON_VALUE_HPP

#include "common.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace pjsk::json {

struct JsonValue;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// A JSON object containing key-value pairs (ordered by key).
using JsonObject = std::map<std::string, JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// A JSON number stored either as a signed integer or a double.
///
/// The parser picks `Int64` for literals without a fraction or exponent that
/// fit in `int64_t`, and `Double` for everything else.
struct JsonNumber {
    enum class Kind : uint8_t {
        Int64, ///< `i64` is active
        Double ///< `f64` is active
    };

    Kind kind;

    union {
        int64_t i64;
        double f64;
    };

    JsonNumber() : kind(Kind::Int64), i64(0) {}
    explicit JsonNumber(int64_t v) : kind(Kind::Int64), i64(v) {}
    explicit JsonNumber(double v) : kind(Kind::Double), f64(v) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind == Kind::Int64;
    }

    /// Returns the value as `int64_t`; doubles convert only when they hold
    /// an exact integral value.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (kind == Kind::Int64) {
            return i64;
        }
        if (f64 >= -9.2e18 && f64 <= 9.2e18 && f64 == static_cast<double>(static_cast<int64_t>(f64))) {
            return static_cast<int64_t>(f64);
        }
        return std::nullopt;
    }

    /// Returns the value as a double (lossy for very large integers).
    [[nodiscard]] auto as_f64() const -> double {
        return kind == Kind::Int64 ? static_cast<double>(i64) : f64;
    }

    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind == Kind::Int64 && other.kind == Kind::Int64) {
            return i64 == other.i64;
        }
        return as_f64() == other.as_f64();
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// A JSON value of any type.
///
/// Arrays and objects are boxed so that the variant has a fixed size.
/// Accessors (`as_*`) throw `std::runtime_error` on a type mismatch; check
/// with the matching `is_*` first.
struct JsonValue {
    using Null = std::monostate;
    using Data = std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>>;

    Data data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(std::nullptr_t) : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(double value) : data(JsonNumber(value)) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonNumber value) : data(value) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    JsonValue(JsonValue&&) noexcept = default;
    auto operator=(JsonValue&&) noexcept -> JsonValue& = default;
    JsonValue(const JsonValue&) = delete;
    auto operator=(const JsonValue&) -> JsonValue& = delete;

    // ------------------------------------------------------------------------
    // Type queries
    // ------------------------------------------------------------------------

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }
    [[nodiscard]] auto is_integer() const -> bool {
        auto* num = std::get_if<JsonNumber>(&data);
        return num != nullptr && num->is_integer();
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // ------------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------------

    [[nodiscard]] auto as_bool() const -> bool {
        return checked<bool>("bool");
    }
    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return checked<JsonNumber>("number");
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return checked<std::string>("string");
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *checked<Box<JsonArray>>("array");
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *checked<Box<JsonObject>>("object");
    }
    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *checked<Box<JsonArray>>("array");
    }
    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *checked<Box<JsonObject>>("object");
    }
    [[nodiscard]] auto as_f64() const -> double {
        return as_number().as_f64();
    }

    /// Integer view of a number value; `nullopt` for non-numbers and
    /// fractional doubles.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (auto* num = std::get_if<JsonNumber>(&data)) {
            return num->try_as_i64();
        }
        return std::nullopt;
    }

    // ------------------------------------------------------------------------
    // Object access
    // ------------------------------------------------------------------------

    /// Looks up `key` in an object; `nullptr` if absent or not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    /// Mutable lookup; `nullptr` if absent or not an object.
    [[nodiscard]] auto get_mut(const std::string& key) -> JsonValue*;

    /// Inserts or replaces `key`. Throws if this value is not an object.
    void set(const std::string& key, JsonValue value);

    /// Removes `key`; returns whether it was present.
    auto remove(const std::string& key) -> bool;

    /// Element count of an array or object, 0 otherwise.
    [[nodiscard]] auto size() const -> size_t;

    // ------------------------------------------------------------------------
    // Serialization
    // ------------------------------------------------------------------------

    /// Compact single-line serialization.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Multi-line serialization with `indent` spaces per level.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    /// Deep copy.
    [[nodiscard]] auto clone() const -> JsonValue;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

private:
    template <typename T> auto checked(const char* expected) const -> const T& {
        if (auto* v = std::get_if<T>(&data)) {
            return *v;
        }
        throw std::runtime_error(std::string("JsonValue is not a ") + expected);
    }
    template <typename T> auto checked(const char* expected) -> T& {
        if (auto* v = std::get_if<T>(&data)) {
            return *v;
        }
        throw std::runtime_error(std::string("JsonValue is not a ") + expected);
    }
};

} // namespace pjsk::json

#endif // PJSK_JSON_VALUE_HPP

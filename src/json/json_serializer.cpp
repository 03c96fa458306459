//! # JSON Serializer
//!
//! Compact and pretty printers for `JsonValue`. Strings are written as
//! UTF-8 with only the escapes JSON requires; doubles use 17 significant
//! digits so that they read back bit-identical.

#include "json/json_value.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace pjsk::json {

namespace {

void append_escaped(const std::string& s, std::string& out) {
    out += '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
                out += oss.str();
            } else {
                out += c;
            }
            break;
        }
    }
    out += '"';
}

auto format_number(const JsonNumber& num) -> std::string {
    if (num.kind == JsonNumber::Kind::Int64) {
        return std::to_string(num.i64);
    }
    // NaN and infinities have no JSON spelling
    if (!std::isfinite(num.f64)) {
        return "null";
    }

    std::ostringstream oss;
    oss << std::setprecision(17) << num.f64;
    std::string result = oss.str();
    if (result.find_first_of(".eE") == std::string::npos) {
        result += ".0";
    }
    return result;
}

void newline_indent(std::string& out, int indent, int depth) {
    out += '\n';
    out.append(static_cast<size_t>(indent * depth), ' ');
}

/// `indent < 0` selects the compact form.
void serialize(const JsonValue& value, std::string& out, int indent, int depth) {
    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_number()) {
        out += format_number(value.as_number());
    } else if (value.is_string()) {
        append_escaped(value.as_string(), out);
    } else if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            out += "[]";
            return;
        }
        out += '[';
        bool first = true;
        for (const auto& elem : arr) {
            if (!first) {
                out += ',';
            }
            first = false;
            if (indent >= 0) {
                newline_indent(out, indent, depth + 1);
            }
            serialize(elem, out, indent, depth + 1);
        }
        if (indent >= 0) {
            newline_indent(out, indent, depth);
        }
        out += ']';
    } else {
        const auto& obj = value.as_object();
        if (obj.empty()) {
            out += "{}";
            return;
        }
        out += '{';
        bool first = true;
        for (const auto& [key, val] : obj) {
            if (!first) {
                out += ',';
            }
            first = false;
            if (indent >= 0) {
                newline_indent(out, indent, depth + 1);
            }
            append_escaped(key, out);
            out += indent >= 0 ? ": " : ":";
            serialize(val, out, indent, depth + 1);
        }
        if (indent >= 0) {
            newline_indent(out, indent, depth);
        }
        out += '}';
    }
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize(*this, out, -1, 0);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize(*this, out, indent < 0 ? 0 : indent, 0);
    return out;
}

} // namespace pjsk::json

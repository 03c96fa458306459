#include "card/render_config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace pjsk::card {

namespace {

constexpr double SPACING_EPSILON = 1e-6;

} // namespace

auto round_spacing(double value) -> double {
    return std::round(value * 100.0) / 100.0;
}

auto spacing_equal(double a, double b) -> bool {
    return std::fabs(a - b) <= SPACING_EPSILON;
}

auto format_spacing(double value) -> std::string {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

// ============================================================================
// CardLimits
// ============================================================================

auto CardLimits::validate() const -> std::optional<std::string> {
    if (font_size_min > font_size_max) {
        return "font_size_min must not exceed font_size_max";
    }
    if (font_size_step <= 0) {
        return "font_size_step must be positive";
    }
    if (!(line_spacing_min <= line_spacing_max)) {
        return "line_spacing_min must not exceed line_spacing_max";
    }
    if (!(line_spacing_step > 0.0)) {
        return "line_spacing_step must be positive";
    }
    if (offset_min > offset_max) {
        return "offset_min must not exceed offset_max";
    }
    if (offset_step <= 0) {
        return "offset_step must be positive";
    }
    if (max_text_length == 0) {
        return "max_text_length must be positive";
    }
    return std::nullopt;
}

auto CardLimits::clamp_font_size(long long value) const -> int {
    return static_cast<int>(std::clamp<long long>(value, font_size_min, font_size_max));
}

auto CardLimits::clamp_line_spacing(double value) const -> double {
    return round_spacing(std::clamp(value, line_spacing_min, line_spacing_max));
}

auto CardLimits::clamp_offset(long long value) const -> int {
    return static_cast<int>(std::clamp<long long>(value, offset_min, offset_max));
}

// ============================================================================
// RenderConfig
// ============================================================================

auto RenderConfig::make_default(const CardDefaults& defaults, const CardLimits& limits)
    -> RenderConfig {
    RenderConfig config;
    config.text = defaults.text;
    config.font_size = limits.clamp_font_size(defaults.font_size);
    config.line_spacing = limits.clamp_line_spacing(defaults.line_spacing);
    config.curve_enabled = false;
    config.offset_x = limits.clamp_offset(0);
    config.offset_y = limits.clamp_offset(0);
    config.role = defaults.role;
    return config;
}

auto RenderConfig::to_json() const -> json::JsonValue {
    json::JsonValue obj(json::JsonObject{});
    obj.set("text", json::JsonValue(text));
    obj.set("font_size", json::JsonValue(font_size));
    obj.set("line_spacing", json::JsonValue(line_spacing));
    obj.set("curve_enabled", json::JsonValue(curve_enabled));
    obj.set("offset_x", json::JsonValue(offset_x));
    obj.set("offset_y", json::JsonValue(offset_y));
    obj.set("role", json::JsonValue(role));
    return obj;
}

auto RenderConfig::from_json(const json::JsonValue& value) -> std::optional<RenderConfig> {
    if (!value.is_object()) {
        return std::nullopt;
    }

    auto* text = value.get("text");
    auto* font_size = value.get("font_size");
    auto* line_spacing = value.get("line_spacing");
    auto* curve_enabled = value.get("curve_enabled");
    auto* offset_x = value.get("offset_x");
    auto* offset_y = value.get("offset_y");
    auto* role = value.get("role");

    if (!text || !text->is_string() || !role || !role->is_string()) {
        return std::nullopt;
    }
    if (!line_spacing || !line_spacing->is_number()) {
        return std::nullopt;
    }
    if (!curve_enabled || !curve_enabled->is_bool()) {
        return std::nullopt;
    }

    auto as_int = [](const json::JsonValue* v) -> std::optional<int> {
        if (!v) {
            return std::nullopt;
        }
        auto i = v->try_as_i64();
        if (!i || *i < INT32_MIN || *i > INT32_MAX) {
            return std::nullopt;
        }
        return static_cast<int>(*i);
    };
    auto fs = as_int(font_size);
    auto ox = as_int(offset_x);
    auto oy = as_int(offset_y);
    if (!fs || !ox || !oy) {
        return std::nullopt;
    }

    RenderConfig config;
    config.text = text->as_string();
    config.font_size = *fs;
    config.line_spacing = line_spacing->as_f64();
    config.curve_enabled = curve_enabled->as_bool();
    config.offset_x = *ox;
    config.offset_y = *oy;
    config.role = role->as_string();
    return config;
}

auto RenderConfig::operator==(const RenderConfig& other) const -> bool {
    return text == other.text && font_size == other.font_size &&
           spacing_equal(line_spacing, other.line_spacing) &&
           curve_enabled == other.curve_enabled && offset_x == other.offset_x &&
           offset_y == other.offset_y && role == other.role;
}

} // namespace pjsk::card

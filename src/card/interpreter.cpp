//! # Command Interpreter Implementation
//!
//! The six mutation rules. Confirmation strings are kept short; the
//! render reply shows the full state underneath them.

#include "card/interpreter.hpp"

#include "card/creation_flags.hpp"
#include "card/text_utils.hpp"
#include "card/tokenizer.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace pjsk::card {

CommandInterpreter::CommandInterpreter(Rc<const CommandVocabulary> vocabulary,
                                       Rc<const PersonaCatalog> catalog, CardLimits limits,
                                       uint32_t seed)
    : vocabulary_(std::move(vocabulary)), catalog_(std::move(catalog)), limits_(limits),
      rng_(seed) {}

auto CommandInterpreter::apply_message(RenderConfig& config, std::string_view message)
    -> Result<std::string, AdjustError> {
    auto [first, remainder] = extract_first_token(message);
    auto [head, variants] = split_dotted(first);
    if (head.empty()) {
        return AdjustError::validation("unrecognized subcommand: " + first);
    }
    return apply(config, head, variants, remainder);
}

auto CommandInterpreter::apply(RenderConfig& config, std::string_view command_token,
                               const std::vector<std::string>& variants,
                               std::string_view remainder) -> Result<std::string, AdjustError> {
    auto command = vocabulary_->commands.resolve(command_token);
    if (!command) {
        PJSK_LOG_DEBUG("interp", "Unrecognized subcommand '" << command_token << "'");
        return AdjustError::validation("unrecognized subcommand: " + std::string(command_token));
    }
    PJSK_LOG_TRACE("interp", "Dispatching '" << command_token << "' as " << *command);

    if (*command == CMD_TEXT) {
        return execute_text(config, remainder);
    }

    auto args = split_args(remainder);
    const std::string* variant = variants.empty() ? nullptr : &variants.front();

    if (*command == CMD_FONT_SIZE) {
        return execute_font_size(config, variant, args);
    }
    if (*command == CMD_LINE_SPACING) {
        return execute_line_spacing(config, variant, args);
    }
    if (*command == CMD_CURVE) {
        return execute_curve(config, variant, args);
    }
    if (*command == CMD_POSITION) {
        return execute_position(config, variants, args);
    }
    if (*command == CMD_ROLE) {
        return execute_role(config, remainder, args);
    }
    return AdjustError::validation("unsupported subcommand: " + std::string(command_token));
}

// ============================================================================
// Rules
// ============================================================================

auto CommandInterpreter::execute_text(RenderConfig& config, std::string_view remainder)
    -> Result<std::string, AdjustError> {
    std::string text = collapse_whitespace(remainder);
    if (text.empty()) {
        return AdjustError::validation("provide text to update");
    }
    if (utf8_length(text) > limits_.max_text_length) {
        return AdjustError::validation("text must not exceed " +
                                       std::to_string(limits_.max_text_length) + " characters");
    }
    config.text = std::move(text);
    PJSK_LOG_DEBUG("interp", "Text updated: " << config.text);
    return std::string("text updated");
}

auto CommandInterpreter::execute_font_size(RenderConfig& config, const std::string* variant,
                                           const std::vector<std::string>& args)
    -> Result<std::string, AdjustError> {
    if (variant) {
        auto action = vocabulary_->size_variants.resolve(*variant);
        if (!action) {
            return AdjustError::validation("unrecognized font size adjustment: " + *variant);
        }
        int previous = config.font_size;
        bool increase = *action == "increase";
        long long target = static_cast<long long>(previous) +
                           (increase ? limits_.font_size_step : -limits_.font_size_step);
        int next = limits_.clamp_font_size(target);
        config.font_size = next;
        if (next == previous) {
            return std::string("font size already at the ") + (increase ? "upper" : "lower") +
                   " bound (" + std::to_string(next) + "px)";
        }
        return std::string("font size ") + (increase ? "increased" : "decreased") + " to " +
               std::to_string(next) + "px";
    }

    if (args.empty()) {
        return AdjustError::validation("provide a font size, for example: 字号 48");
    }
    auto parsed = parse_int(args.front());
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }
    long long value = unwrap(parsed);
    int clamped = limits_.clamp_font_size(value);
    config.font_size = clamped;
    if (clamped != value) {
        return "font size set to " + std::to_string(clamped) + "px (clamped to range " +
               std::to_string(limits_.font_size_min) + "-" +
               std::to_string(limits_.font_size_max) + ")";
    }
    return "font size set to " + std::to_string(clamped) + "px";
}

auto CommandInterpreter::execute_line_spacing(RenderConfig& config, const std::string* variant,
                                              const std::vector<std::string>& args)
    -> Result<std::string, AdjustError> {
    if (variant) {
        auto action = vocabulary_->size_variants.resolve(*variant);
        if (!action) {
            return AdjustError::validation("unrecognized line spacing adjustment: " + *variant);
        }
        double previous = config.line_spacing;
        bool increase = *action == "increase";
        double next = limits_.clamp_line_spacing(
            previous + (increase ? limits_.line_spacing_step : -limits_.line_spacing_step));
        config.line_spacing = next;
        if (spacing_equal(next, previous)) {
            return std::string("line spacing already at the ") + (increase ? "upper" : "lower") +
                   " bound (" + format_spacing(next) + ")";
        }
        return std::string("line spacing ") + (increase ? "increased" : "decreased") + " to " +
               format_spacing(next);
    }

    if (args.empty()) {
        return AdjustError::validation("provide a line spacing, for example: 行距 1.8");
    }
    auto parsed = parse_float(args.front());
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }
    double value = unwrap(parsed);
    double clamped = limits_.clamp_line_spacing(value);
    config.line_spacing = clamped;
    if (!spacing_equal(clamped, value)) {
        return "line spacing set to " + format_spacing(clamped) + " (clamped to range " +
               format_spacing(limits_.line_spacing_min) + "-" +
               format_spacing(limits_.line_spacing_max) + ")";
    }
    return "line spacing set to " + format_spacing(clamped);
}

auto CommandInterpreter::execute_curve(RenderConfig& config, const std::string* variant,
                                       const std::vector<std::string>& args) -> std::string {
    std::optional<std::string> action;
    if (variant) {
        action = vocabulary_->curve_variants.resolve(*variant);
    }
    if (!action && !args.empty()) {
        action = vocabulary_->curve_variants.resolve(args.front());
    }

    bool enabled = !config.curve_enabled;
    if (action == "on") {
        enabled = true;
    } else if (action == "off") {
        enabled = false;
    }
    config.curve_enabled = enabled;
    return enabled ? "curve enabled" : "curve disabled";
}

auto CommandInterpreter::execute_position(RenderConfig& config,
                                          const std::vector<std::string>& variants,
                                          const std::vector<std::string>& args)
    -> Result<std::string, AdjustError> {
    std::optional<std::string> direction;
    size_t next_arg = 0;

    if (!variants.empty()) {
        direction = vocabulary_->directions.resolve(variants.front());
    }
    if (!direction && !args.empty()) {
        direction = vocabulary_->directions.resolve(args.front());
        if (direction) {
            next_arg = 1;
        }
    }
    if (!direction) {
        return AdjustError::validation("specify a direction, for example: 位置.上 or 位置 下");
    }

    long long amount = limits_.offset_step;
    if (next_arg < args.size()) {
        auto parsed = parse_positive_int(args[next_arg]);
        if (is_err(parsed)) {
            return unwrap_err(parsed);
        }
        amount = unwrap(parsed);
    }

    bool vertical = *direction == "up" || *direction == "down";
    bool negative = *direction == "up" || *direction == "left";
    int& field = vertical ? config.offset_y : config.offset_x;
    const char* axis = vertical ? "Y" : "X";

    int previous = field;
    int next = limits_.clamp_offset(static_cast<long long>(previous) + (negative ? -amount : amount));
    field = next;

    int applied = negative ? previous - next : next - previous;
    std::string coordinate = std::string(axis) + "=" + std::to_string(next);
    if (applied == 0) {
        return "boundary reached moving " + *direction + " (" + coordinate + ")";
    }
    return "moved " + *direction + " by " + std::to_string(applied) + ", now " + coordinate;
}

auto CommandInterpreter::execute_role(RenderConfig& config, std::string_view remainder,
                                      const std::vector<std::string>& args)
    -> Result<std::string, AdjustError> {
    if (!args.empty() && is_random_marker(args.front())) {
        std::string picked = catalog_->pick_random(config.role, rng_);
        config.role = picked;
        return "persona randomly switched to " + picked;
    }

    std::string candidate = trim(remainder);
    if (candidate.empty()) {
        return AdjustError::validation("provide a persona name, or -r for a random one");
    }
    auto resolved = catalog_->resolve(candidate);
    if (!resolved) {
        return AdjustError::validation("unrecognized persona: " + candidate);
    }
    config.role = *resolved;
    return "persona switched to " + *resolved;
}

} // namespace pjsk::card

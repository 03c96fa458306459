#include "card/creation_flags.hpp"

#include "card/text_utils.hpp"
#include "card/tokenizer.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <array>

namespace pjsk::card {

namespace {

constexpr std::array<std::string_view, 8> FLAGS = {"-n", "-x", "-y", "-r",
                                                   "-s", "-l", "-c", "--daf"};

/// Whole-integer parse: "12" and "-6" but not "1.5" or "12px".
auto parse_plain_int(const std::string& raw) -> std::optional<long long> {
    if (raw.empty()) {
        return std::nullopt;
    }
    size_t start = (raw[0] == '-' || raw[0] == '+') ? 1 : 0;
    if (start == raw.size() || raw.size() > 18) {
        return std::nullopt;
    }
    if (!std::all_of(raw.begin() + static_cast<std::ptrdiff_t>(start), raw.end(),
                     [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    return std::stoll(raw);
}

} // namespace

auto is_random_marker(std::string_view value) -> bool {
    std::string lowered = to_lower_ascii(trim(value));
    return lowered == "-r" || lowered == "random" || lowered == "随机";
}

auto CreationFlags::random_role() const -> bool {
    return role.has_value() && is_random_marker(*role);
}

auto is_flag_style(std::string_view message) -> bool {
    auto first = extract_first_token(message).token;
    return std::find(FLAGS.begin(), FLAGS.end(), first) != FLAGS.end();
}

auto parse_creation_flags(const std::vector<std::string>& args) -> CreationFlags {
    CreationFlags flags;

    auto int_flag = [](std::string_view flag, const std::string& raw,
                       std::optional<long long>& target) {
        if (auto value = parse_plain_int(raw)) {
            target = *value;
        } else {
            PJSK_LOG_WARN("flags", "Ignoring " << flag << " with non-integer value '" << raw
                                               << "'");
        }
    };

    size_t i = 0;
    while (i < args.size()) {
        const std::string& part = args[i];
        bool has_value = i + 1 < args.size();

        if (part == "-n" && has_value) {
            flags.text = args[i + 1];
            i += 2;
        } else if (part == "-x" && has_value) {
            int_flag(part, args[i + 1], flags.offset_x);
            i += 2;
        } else if (part == "-y" && has_value) {
            int_flag(part, args[i + 1], flags.offset_y);
            i += 2;
        } else if (part == "-s" && has_value) {
            int_flag(part, args[i + 1], flags.font_size);
            i += 2;
        } else if (part == "-r" && has_value) {
            flags.role = args[i + 1];
            i += 2;
        } else if (part == "-l" && has_value) {
            auto value = parse_float(args[i + 1]);
            if (is_ok(value)) {
                flags.line_spacing = unwrap(value);
            } else {
                PJSK_LOG_WARN("flags", "Ignoring -l with non-numeric value '" << args[i + 1]
                                                                              << "'");
            }
            i += 2;
        } else if (part == "-c") {
            flags.curve = true;
            i += 1;
        } else if (part == "--daf") {
            flags.default_font = true;
            i += 1;
        } else {
            PJSK_LOG_DEBUG("flags", "Skipping unrecognized token '" << part << "'");
            i += 1;
        }
    }
    return flags;
}

} // namespace pjsk::card

#include "config/card_config.hpp"

#include "card/text_utils.hpp"
#include "config/toml_reader.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

namespace pjsk::config {

namespace {

constexpr std::array<std::string_view, 8> LOG_LEVELS = {
    "trace", "debug", "info", "warn", "warning", "error", "fatal", "off"};

/// Typed reads from one section. The first type error sticks; later reads
/// become no-ops so the caller checks once at the end.
class SectionReader {
public:
    SectionReader(const TomlDocument& doc, std::string_view section)
        : table_(doc.table(section)), section_(section) {}

    void read(std::string_view key, std::string& out) {
        if (const auto* entry = lookup(key)) {
            if (const auto* s = std::get_if<std::string>(&entry->value)) {
                out = *s;
            } else {
                type_error(*entry, "a string");
            }
        }
    }

    void read(std::string_view key, bool& out) {
        if (const auto* entry = lookup(key)) {
            if (const auto* b = std::get_if<bool>(&entry->value)) {
                out = *b;
            } else {
                type_error(*entry, "a boolean");
            }
        }
    }

    void read(std::string_view key, int& out) {
        if (const auto* entry = lookup(key)) {
            const auto* i = std::get_if<long long>(&entry->value);
            if (!i) {
                type_error(*entry, "an integer");
            } else if (*i < std::numeric_limits<int>::min() ||
                       *i > std::numeric_limits<int>::max()) {
                fail(*entry, "is out of range");
            } else {
                out = static_cast<int>(*i);
            }
        }
    }

    void read(std::string_view key, size_t& out) {
        if (const auto* entry = lookup(key)) {
            const auto* i = std::get_if<long long>(&entry->value);
            if (!i) {
                type_error(*entry, "an integer");
            } else if (*i < 0) {
                fail(*entry, "must not be negative");
            } else {
                out = static_cast<size_t>(*i);
            }
        }
    }

    /// Accepts integers as well as floats.
    void read(std::string_view key, double& out) {
        if (const auto* entry = lookup(key)) {
            if (const auto* d = std::get_if<double>(&entry->value)) {
                out = *d;
            } else if (const auto* i = std::get_if<long long>(&entry->value)) {
                out = static_cast<double>(*i);
            } else {
                type_error(*entry, "a number");
            }
        }
    }

    /// Logs keys that no read asked for.
    void warn_unknown() const {
        if (!table_) {
            return;
        }
        for (const auto& entry : table_->entries) {
            if (seen_.count(entry.key) == 0) {
                PJSK_LOG_WARN("config", "Unknown key '" << entry.key << "' in [" << section_
                                                        << "] (line " << entry.line << ")");
            }
        }
    }

    [[nodiscard]] auto error() const -> const std::optional<ConfigError>& {
        return error_;
    }

private:
    const TomlTable* table_;
    std::string section_;
    std::set<std::string, std::less<>> seen_;
    std::optional<ConfigError> error_;

    auto lookup(std::string_view key) -> const TomlEntry* {
        seen_.emplace(key);
        if (!table_ || error_) {
            return nullptr;
        }
        return table_->find(key);
    }

    void type_error(const TomlEntry& entry, const char* expected) {
        fail(entry, std::string("must be ") + expected + ", found " +
                        toml_type_name(entry.value));
    }

    void fail(const TomlEntry& entry, const std::string& what) {
        error_ = ConfigError{"Line " + std::to_string(entry.line) + ": [" + section_ + "] " +
                             entry.key + " " + what};
    }
};

/// Reads a section whose keys are names and whose values are string arrays.
auto read_name_lists(const TomlTable& table)
    -> Result<std::vector<std::pair<std::string, std::vector<std::string>>>, ConfigError> {
    std::vector<std::pair<std::string, std::vector<std::string>>> result;
    for (const auto& entry : table.entries) {
        const auto* list = std::get_if<std::vector<std::string>>(&entry.value);
        if (!list) {
            return ConfigError{"Line " + std::to_string(entry.line) + ": [" + table.name + "] " +
                               entry.key + " must be an array of strings"};
        }
        result.emplace_back(entry.key, *list);
    }
    return result;
}

} // namespace

// ============================================================================
// Loading
// ============================================================================

auto CardConfig::parse(const std::string& content) -> Result<CardConfig, ConfigError> {
    SimpleTomlParser parser(content);
    auto doc = parser.parse();
    if (!doc) {
        return ConfigError{parser.get_error()};
    }

    CardConfig config;

    SectionReader messaging(*doc, "messaging");
    messaging.read("show_success_messages", config.messaging.show_success_messages);
    messaging.read("mention_user_on_render", config.messaging.mention_user_on_render);
    messaging.read("selection_timeout_seconds", config.messaging.selection_timeout_seconds);

    SectionReader render(*doc, "render");
    render.read("adaptive_text_sizing", config.render.adaptive_text_sizing);
    render.read("default_curve_intensity", config.render.default_curve_intensity);
    render.read("enable_text_shadow", config.render.enable_text_shadow);
    render.read("default_emoji_set", config.render.default_emoji_set);

    SectionReader persistence(*doc, "persistence");
    persistence.read("enabled", config.persistence.enabled);
    persistence.read("state_ttl_hours", config.persistence.state_ttl_hours);
    persistence.read("storage_path", config.persistence.storage_path);

    SectionReader logging(*doc, "logging");
    logging.read("level", config.logging.level);
    logging.read("file", config.logging.file);

    SectionReader limits(*doc, "limits");
    limits.read("font_size_min", config.limits.font_size_min);
    limits.read("font_size_max", config.limits.font_size_max);
    limits.read("font_size_step", config.limits.font_size_step);
    limits.read("line_spacing_min", config.limits.line_spacing_min);
    limits.read("line_spacing_max", config.limits.line_spacing_max);
    limits.read("line_spacing_step", config.limits.line_spacing_step);
    limits.read("offset_min", config.limits.offset_min);
    limits.read("offset_max", config.limits.offset_max);
    limits.read("offset_step", config.limits.offset_step);
    limits.read("max_text_length", config.limits.max_text_length);

    SectionReader defaults(*doc, "defaults");
    defaults.read("text", config.defaults.text);
    defaults.read("font_size", config.defaults.font_size);
    defaults.read("line_spacing", config.defaults.line_spacing);
    defaults.read("role", config.defaults.role);

    for (const SectionReader* reader :
         {&messaging, &render, &persistence, &logging, &limits, &defaults}) {
        if (reader->error()) {
            return *reader->error();
        }
        reader->warn_unknown();
    }

    if (const auto* table = doc->table("personas")) {
        auto lists = read_name_lists(*table);
        if (is_err(lists)) {
            return unwrap_err(lists);
        }
        config.personas.clear();
        for (auto& [name, aliases] : unwrap(lists)) {
            config.personas.push_back(card::PersonaEntry{name, std::move(aliases)});
        }
    }

    if (const auto* table = doc->table("groups")) {
        auto lists = read_name_lists(*table);
        if (is_err(lists)) {
            return unwrap_err(lists);
        }
        config.groups.clear();
        for (auto& [name, members] : unwrap(lists)) {
            config.groups.push_back(card::PersonaGroup{name, std::move(members)});
        }
    }

    for (const auto& table : doc->tables) {
        static const std::set<std::string, std::less<>> known = {
            "", "messaging", "render", "persistence", "logging",
            "limits", "defaults", "personas", "groups"};
        if (known.count(table.name) == 0) {
            PJSK_LOG_WARN("config", "Ignoring unknown section [" << table.name << "]");
        } else if (table.name.empty() && !table.entries.empty()) {
            PJSK_LOG_WARN("config", "Ignoring " << table.entries.size()
                                                << " key(s) outside any section");
        }
    }

    return config;
}

auto CardConfig::load(const fs::path& path) -> Result<CardConfig, ConfigError> {
    std::ifstream file(path);
    if (!file) {
        return ConfigError{"Cannot open " + path.string()};
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    auto parsed = parse(content);
    if (is_err(parsed)) {
        return ConfigError{path.string() + ": " + unwrap_err(parsed).message};
    }
    auto& config = unwrap(parsed);
    if (auto invalid = config.validate()) {
        return ConfigError{path.string() + ": " + invalid->message};
    }
    PJSK_LOG_INFO("config", "Loaded " << path.string() << " (" << config.personas.size()
                                      << " personas)");
    return std::move(config);
}

auto CardConfig::load_or_default(const fs::path& path) -> CardConfig {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        PJSK_LOG_INFO("config", "No configuration at " << path.string() << ", using defaults");
        return CardConfig{};
    }
    auto loaded = load(path);
    if (is_err(loaded)) {
        PJSK_LOG_WARN("config", unwrap_err(loaded).message << "; using defaults");
        return CardConfig{};
    }
    return std::move(unwrap(loaded));
}

// ============================================================================
// Validation
// ============================================================================

auto CardConfig::validate() const -> std::optional<ConfigError> {
    if (auto problem = limits.validate()) {
        return ConfigError{*problem};
    }
    if (defaults.font_size < limits.font_size_min || defaults.font_size > limits.font_size_max) {
        return ConfigError{"default font_size " + std::to_string(defaults.font_size) +
                           " is outside " + std::to_string(limits.font_size_min) + "-" +
                           std::to_string(limits.font_size_max)};
    }
    if (defaults.line_spacing < limits.line_spacing_min ||
        defaults.line_spacing > limits.line_spacing_max) {
        return ConfigError{"default line_spacing " + card::format_spacing(defaults.line_spacing) +
                           " is outside " + card::format_spacing(limits.line_spacing_min) + "-" +
                           card::format_spacing(limits.line_spacing_max)};
    }
    if (card::trim(defaults.text).empty()) {
        return ConfigError{"default text must not be empty"};
    }
    if (card::utf8_length(defaults.text) > limits.max_text_length) {
        return ConfigError{"default text is longer than max_text_length"};
    }
    if (personas.empty()) {
        return ConfigError{"at least one persona is required"};
    }
    auto named = [&](const std::string& name) {
        return std::any_of(personas.begin(), personas.end(),
                           [&](const auto& persona) { return persona.name == name; });
    };
    if (!named(defaults.role)) {
        return ConfigError{"default role '" + defaults.role + "' is not a configured persona"};
    }
    if (!(persistence.state_ttl_hours > 0.0)) {
        return ConfigError{"state_ttl_hours must be positive"};
    }
    if (persistence.enabled && persistence.storage_path.empty()) {
        return ConfigError{"storage_path must not be empty when persistence is enabled"};
    }
    if (!(messaging.selection_timeout_seconds > 0.0)) {
        return ConfigError{"selection_timeout_seconds must be positive"};
    }
    if (std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), logging.level) == LOG_LEVELS.end()) {
        return ConfigError{"unknown log level '" + logging.level + "'"};
    }
    return std::nullopt;
}

auto CardConfig::build_catalog() const -> Result<card::PersonaCatalog, card::AliasConflict> {
    return card::PersonaCatalog::build(personas, groups);
}

auto CardConfig::coordinator_settings() const -> render::CoordinatorSettings {
    render::CoordinatorSettings settings;
    settings.limits = limits;
    settings.defaults = defaults;
    settings.curve_intensity = render.default_curve_intensity;
    settings.shadow_enabled = render.enable_text_shadow;
    settings.emoji_set = render.default_emoji_set;
    settings.adaptive_text_sizing = render.adaptive_text_sizing;
    settings.show_success_messages = messaging.show_success_messages;
    settings.mention_user_on_render = messaging.mention_user_on_render;
    settings.persistence_enabled = persistence.enabled;
    settings.state_ttl_hours = persistence.state_ttl_hours;
    settings.selection_timeout_seconds = messaging.selection_timeout_seconds;
    return settings;
}

} // namespace pjsk::config

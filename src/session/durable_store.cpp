#include "session/durable_store.hpp"

#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace pjsk::session {

namespace {

constexpr const char* STATES_KEY = "states";
constexpr const char* CONFIG_KEY = "config";
constexpr const char* LEGACY_CONFIG_KEY = "state";
constexpr const char* TIMESTAMP_KEY = "timestamp";
constexpr const char* LAST_UPDATED_KEY = "last_updated";

auto entry_config(const json::JsonValue& entry) -> std::optional<card::RenderConfig> {
    const auto* snapshot = entry.get(CONFIG_KEY);
    if (!snapshot) {
        snapshot = entry.get(LEGACY_CONFIG_KEY);
    }
    if (!snapshot) {
        return std::nullopt;
    }
    return card::RenderConfig::from_json(*snapshot);
}

} // namespace

DurableStore::DurableStore(fs::path path, Clock clock)
    : path_(std::move(path)), clock_(std::move(clock)) {}

// ============================================================================
// Document I/O
// ============================================================================

auto DurableStore::load_states() const -> json::JsonValue {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return json::JsonValue(json::JsonObject{});
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        PJSK_LOG_WARN("store", "Cannot open " << path_.string() << ", treating as empty");
        return json::JsonValue(json::JsonObject{});
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto parsed = json::parse_json(buffer.str());
    if (is_err(parsed)) {
        PJSK_LOG_WARN("store", "Corrupt document " << path_.string() << ": "
                                                   << unwrap_err(parsed).to_string()
                                                   << ", treating as empty");
        return json::JsonValue(json::JsonObject{});
    }

    auto& document = unwrap(parsed);
    auto* states = document.get_mut(STATES_KEY);
    if (!states || !states->is_object()) {
        if (document.is_object() && !document.as_object().empty()) {
            PJSK_LOG_WARN("store", "Document " << path_.string() << " has no states object");
        }
        return json::JsonValue(json::JsonObject{});
    }
    return std::move(*states);
}

auto DurableStore::save_states(json::JsonValue states) -> bool {
    json::JsonValue document(json::JsonObject{});
    document.set(STATES_KEY, std::move(states));
    document.set(LAST_UPDATED_KEY, json::JsonValue(clock_()));

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            PJSK_LOG_WARN("store", "Cannot create " << path_.parent_path().string() << ": "
                                                    << ec.message());
            return false;
        }
    }

    fs::path temp = path_;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            PJSK_LOG_WARN("store", "Cannot write " << temp.string());
            return false;
        }
        out << document.to_string_pretty(2) << "\n";
        out.flush();
        if (!out) {
            PJSK_LOG_WARN("store", "Short write to " << temp.string());
            return false;
        }
    }

    fs::rename(temp, path_, ec);
    if (ec) {
        PJSK_LOG_WARN("store", "Cannot replace " << path_.string() << ": " << ec.message());
        fs::remove(temp, ec);
        return false;
    }
    return true;
}

auto DurableStore::is_expired(const json::JsonValue& entry, double now, double ttl_hours) const
    -> bool {
    const auto* timestamp = entry.get(TIMESTAMP_KEY);
    if (!timestamp || !timestamp->is_number()) {
        return false;
    }
    return now - timestamp->as_f64() > ttl_hours * 3600.0;
}

// ============================================================================
// Operations
// ============================================================================

auto DurableStore::get(const SessionKey& key, double ttl_hours)
    -> std::optional<card::RenderConfig> {
    auto states = load_states();
    auto storage_key = key.storage_key();
    const auto* entry = states.get(storage_key);
    if (!entry) {
        return std::nullopt;
    }

    if (is_expired(*entry, clock_(), ttl_hours)) {
        PJSK_LOG_DEBUG("store", "Entry " << storage_key << " expired");
        states.remove(storage_key);
        if (!save_states(std::move(states))) {
            PJSK_LOG_DEBUG("store", "Expired entry " << storage_key << " stays on disk");
        }
        return std::nullopt;
    }

    auto config = entry_config(*entry);
    if (!config) {
        PJSK_LOG_WARN("store", "Entry " << storage_key << " is malformed, ignoring");
    }
    return config;
}

auto DurableStore::set(const SessionKey& key, const card::RenderConfig& config) -> bool {
    auto states = load_states();

    json::JsonValue entry(json::JsonObject{});
    entry.set(CONFIG_KEY, config.to_json());
    entry.set(TIMESTAMP_KEY, json::JsonValue(clock_()));
    states.set(key.storage_key(), std::move(entry));

    bool saved = save_states(std::move(states));
    PJSK_LOG_TRACE("store", "Saved " << key.storage_key() << (saved ? "" : " (failed)"));
    return saved;
}

auto DurableStore::remove(const SessionKey& key) -> bool {
    auto states = load_states();
    if (!states.remove(key.storage_key())) {
        return false;
    }
    return save_states(std::move(states));
}

auto DurableStore::cleanup_expired(double ttl_hours) -> size_t {
    auto states = load_states();
    double now = clock_();

    auto& entries = states.as_object_mut();
    size_t removed = 0;
    for (auto it = entries.begin(); it != entries.end();) {
        if (is_expired(it->second, now, ttl_hours)) {
            it = entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed == 0) {
        return 0;
    }
    if (!save_states(std::move(states))) {
        PJSK_LOG_WARN("store", removed << " expired entries could not be removed from disk");
        return 0;
    }
    PJSK_LOG_INFO("store", "Removed " << removed << " expired entries");
    return removed;
}

auto DurableStore::get_all() const -> std::map<std::string, card::RenderConfig> {
    std::map<std::string, card::RenderConfig> result;
    auto states = load_states();
    for (const auto& [key, entry] : states.as_object()) {
        if (auto config = entry_config(entry)) {
            result.emplace(key, std::move(*config));
        }
    }
    return result;
}

} // namespace pjsk::session

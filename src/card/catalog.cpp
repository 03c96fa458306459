#include "card/catalog.hpp"

#include "card/text_utils.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace pjsk::card {

auto PersonaCatalog::builtin_personas() -> std::vector<PersonaEntry> {
    return {
        {"初音未来", {"初音", "miku", "hatsune", "hatsune miku"}},
        {"星乃一歌", {"一歌", "ichika"}},
        {"天马咲希", {"咲希", "saki"}},
        {"望月穗波", {"穗波", "honami"}},
        {"日野森志步", {"志步", "shiho"}},
        {"东云彰人", {"彰人", "akito"}},
        {"青柳冬弥", {"冬弥", "toya"}},
        {"小豆泽心羽", {"心羽", "kohane"}},
    };
}

auto PersonaCatalog::builtin_groups() -> std::vector<PersonaGroup> {
    return {
        {"Leo/need", {"星乃一歌", "天马咲希", "望月穗波", "日野森志步"}},
        {"MORE MORE JUMP!", {"初音未来"}},
        {"Vivid BAD SQUAD", {"东云彰人", "青柳冬弥"}},
        {"Nightcord at 25:00", {"小豆泽心羽"}},
    };
}

auto PersonaCatalog::build(std::vector<PersonaEntry> personas, std::vector<PersonaGroup> groups)
    -> Result<PersonaCatalog, AliasConflict> {
    AliasGroups alias_groups;
    alias_groups.reserve(personas.size());
    for (auto& persona : personas) {
        alias_groups.push_back({std::move(persona.name), std::move(persona.aliases)});
    }

    auto table = AliasTable::build(alias_groups);
    if (is_err(table)) {
        return unwrap_err(table);
    }

    PersonaCatalog catalog;
    catalog.aliases_ = std::move(unwrap(table));

    for (auto& group : groups) {
        auto& members = group.members;
        auto unknown = std::remove_if(members.begin(), members.end(), [&](const auto& member) {
            return !catalog.contains(member);
        });
        for (auto it = unknown; it != members.end(); ++it) {
            PJSK_LOG_WARN("catalog",
                          "Group '" << group.name << "' lists unknown persona '" << *it << "'");
        }
        members.erase(unknown, members.end());
        catalog.groups_.push_back(std::move(group));
    }
    return catalog;
}

auto PersonaCatalog::builtin() -> PersonaCatalog {
    auto built = build(builtin_personas(), builtin_groups());
    if (is_err(built)) {
        throw std::logic_error("built-in persona aliases are ambiguous: " +
                               unwrap_err(built).to_string());
    }
    return std::move(unwrap(built));
}

auto PersonaCatalog::resolve(std::string_view input) const -> std::optional<std::string> {
    return aliases_.resolve(trim(input));
}

auto PersonaCatalog::resolve_selection(std::string_view input) const
    -> std::optional<std::string> {
    std::string candidate = trim(input);
    if (!candidate.empty() && candidate.size() <= 3 &&
        std::all_of(candidate.begin(), candidate.end(),
                    [](char c) { return c >= '0' && c <= '9'; })) {
        size_t index = static_cast<size_t>(std::stoi(candidate));
        if (index >= 1 && index <= names().size()) {
            return names()[index - 1];
        }
        return std::nullopt;
    }
    return aliases_.resolve(candidate);
}

auto PersonaCatalog::contains(std::string_view name) const -> bool {
    const auto& all = names();
    return std::find(all.begin(), all.end(), name) != all.end();
}

auto PersonaCatalog::group_of(std::string_view name) const -> std::optional<std::string> {
    for (const auto& group : groups_) {
        if (std::find(group.members.begin(), group.members.end(), name) != group.members.end()) {
            return group.name;
        }
    }
    return std::nullopt;
}

auto PersonaCatalog::aliases_of(std::string_view name) const -> std::vector<std::string> {
    auto all = aliases_.aliases_of(name);
    all.erase(std::remove(all.begin(), all.end(), std::string(name)), all.end());
    return all;
}

auto PersonaCatalog::pick_random(std::string_view exclude, std::mt19937& rng) const
    -> std::string {
    std::vector<std::string> candidates;
    for (const auto& name : names()) {
        if (name != exclude) {
            candidates.push_back(name);
        }
    }
    if (candidates.empty()) {
        candidates = names();
    }
    if (candidates.empty()) {
        return std::string(exclude);
    }
    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return candidates[dist(rng)];
}

auto PersonaCatalog::format_list() const -> std::string {
    std::ostringstream oss;
    oss << "All personas (" << names().size() << "):\n";
    size_t index = 1;
    for (const auto& name : names()) {
        oss << "\n" << index++ << ". " << name;
    }
    return oss.str();
}

auto PersonaCatalog::format_groups() const -> std::string {
    std::ostringstream oss;
    oss << "Persona groups:\n";
    for (const auto& group : groups_) {
        oss << "\n[" << group.name << "]";
        for (const auto& member : group.members) {
            oss << "\n  • " << member;
        }
        oss << "\n";
    }
    return oss.str();
}

auto PersonaCatalog::format_detail(std::string_view name) const -> std::string {
    std::ostringstream oss;
    oss << "Persona: " << name << "\n\nAliases: ";
    auto aliases = aliases_of(name);
    for (size_t i = 0; i < aliases.size(); ++i) {
        oss << (i == 0 ? "" : ", ") << aliases[i];
    }
    if (auto group = group_of(name)) {
        oss << "\nGroup: " << *group;
    }
    oss << "\n\nSend /pjsk.draw to start a card with this persona.";
    return oss.str();
}

} // namespace pjsk::card

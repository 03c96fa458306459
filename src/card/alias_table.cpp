#include "card/alias_table.hpp"

#include "card/text_utils.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace pjsk::card {

auto AliasTable::build(const AliasGroups& groups) -> Result<AliasTable, AliasConflict> {
    AliasTable table;

    auto insert = [&table](const std::string& key,
                           const std::string& canonical) -> std::optional<AliasConflict> {
        auto [it, inserted] = table.lookup_.emplace(key, canonical);
        if (!inserted && it->second != canonical) {
            return AliasConflict{key, it->second, canonical};
        }
        return std::nullopt;
    };

    for (const auto& group : groups) {
        if (group.canonical.empty()) {
            continue;
        }
        if (table.aliases_.find(group.canonical) == table.aliases_.end()) {
            table.canonical_order_.push_back(group.canonical);
        }
        auto& registered = table.aliases_[group.canonical];

        std::vector<std::string> names;
        names.reserve(group.aliases.size() + 1);
        names.push_back(group.canonical);
        names.insert(names.end(), group.aliases.begin(), group.aliases.end());

        for (const auto& alias : names) {
            if (alias.empty()) {
                continue;
            }
            if (auto conflict = insert(alias, group.canonical)) {
                PJSK_LOG_ERROR("alias", conflict->to_string());
                return *conflict;
            }
            if (auto conflict = insert(to_lower_ascii(alias), group.canonical)) {
                PJSK_LOG_ERROR("alias", conflict->to_string());
                return *conflict;
            }
            if (std::find(registered.begin(), registered.end(), alias) == registered.end()) {
                registered.push_back(alias);
            }
        }
    }

    PJSK_LOG_TRACE("alias", "Built alias table with " << table.canonical_order_.size()
                                                      << " groups, " << table.lookup_.size()
                                                      << " keys");
    return table;
}

auto AliasTable::resolve(std::string_view token) const -> std::optional<std::string> {
    if (token.empty()) {
        return std::nullopt;
    }
    auto it = lookup_.find(std::string(token));
    if (it != lookup_.end()) {
        return it->second;
    }
    it = lookup_.find(to_lower_ascii(token));
    if (it != lookup_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto AliasTable::aliases_of(std::string_view canonical) const -> std::vector<std::string> {
    auto it = aliases_.find(std::string(canonical));
    if (it == aliases_.end()) {
        return {};
    }
    return it->second;
}

} // namespace pjsk::card

//! # Alias Tables
//!
//! Case-insensitive lookup from user-typed aliases to canonical names.
//!
//! Every alias is registered twice, as given and ASCII-lowercased, so a
//! lookup tries the exact token first and the lowered token second. The
//! canonical name is always an alias of itself. An alias that would map to
//! two different canonical names is rejected when the table is built.
//!
//! ```cpp
//! auto table = AliasTable::build({{"up", {"上", "u", "↑"}}, {"down", {"下", "d"}}});
//! if (is_ok(table)) {
//!     unwrap(table).resolve("U");   // "up"
//! }
//! ```

#ifndef PJSK_CARD_ALIAS_TABLE_HPP
#define PJSK_CARD_ALIAS_TABLE_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pjsk::card {

/// One canonical name with the aliases that resolve to it.
struct AliasGroup {
    std::string canonical;
    std::vector<std::string> aliases;
};

/// Ordered list of groups; order is preserved by `canonical_names()`.
using AliasGroups = std::vector<AliasGroup>;

/// Raised by `AliasTable::build` when one alias names two canonical entries.
struct AliasConflict {
    std::string alias;
    std::string existing;
    std::string incoming;

    [[nodiscard]] auto to_string() const -> std::string {
        return "alias '" + alias + "' maps to both '" + existing + "' and '" + incoming + "'";
    }
};

/// Immutable alias lookup.
class AliasTable {
public:
    AliasTable() = default;

    /// Builds a table from `groups`, failing on the first ambiguous alias.
    [[nodiscard]] static auto build(const AliasGroups& groups) -> Result<AliasTable, AliasConflict>;

    /// Resolves `token` to its canonical name, exact match first.
    [[nodiscard]] auto resolve(std::string_view token) const -> std::optional<std::string>;

    /// Canonical names in registration order.
    [[nodiscard]] auto canonical_names() const -> const std::vector<std::string>& {
        return canonical_order_;
    }

    /// Aliases of `canonical` as registered (empty if unknown).
    [[nodiscard]] auto aliases_of(std::string_view canonical) const -> std::vector<std::string>;

    /// Number of distinct lookup keys.
    [[nodiscard]] auto size() const -> size_t {
        return lookup_.size();
    }

private:
    std::unordered_map<std::string, std::string> lookup_;
    std::vector<std::string> canonical_order_;
    std::unordered_map<std::string, std::vector<std::string>> aliases_;
};

} // namespace pjsk::card

#endif // PJSK_CARD_ALIAS_TABLE_HPP

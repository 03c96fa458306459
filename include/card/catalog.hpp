//! # Persona Catalog
//!
//! The closed set of personas a card can show, their aliases and the groups
//! they belong to. The catalog is immutable once built and is shared by the
//! interpreter (role resolution, random pick) and the list/select replies.

#ifndef PJSK_CARD_CATALOG_HPP
#define PJSK_CARD_CATALOG_HPP

#include "card/alias_table.hpp"

#include <optional>
#include <random>
#include <string>
#include <vector>

namespace pjsk::card {

/// A persona and the aliases users may type for it.
struct PersonaEntry {
    std::string name;
    std::vector<std::string> aliases;
};

/// A named group of personas, listed in display order.
struct PersonaGroup {
    std::string name;
    std::vector<std::string> members;
};

/// Immutable persona set with alias resolution and listing helpers.
class PersonaCatalog {
public:
    PersonaCatalog() = default;

    /// Builds a catalog.
    ///
    /// # Arguments
    ///
    /// * `personas` - Personas in display order
    /// * `groups` - Group membership; members must name a persona
    ///
    /// # Returns
    ///
    /// The catalog, or the first alias that names two personas.
    [[nodiscard]] static auto build(std::vector<PersonaEntry> personas,
                                    std::vector<PersonaGroup> groups)
        -> Result<PersonaCatalog, AliasConflict>;

    /// The eight built-in personas and their four groups.
    [[nodiscard]] static auto builtin() -> PersonaCatalog;

    /// Built-in persona entries, for seeding configuration defaults.
    [[nodiscard]] static auto builtin_personas() -> std::vector<PersonaEntry>;

    /// Built-in groups, for seeding configuration defaults.
    [[nodiscard]] static auto builtin_groups() -> std::vector<PersonaGroup>;

    /// Resolves an alias (surrounding whitespace ignored).
    [[nodiscard]] auto resolve(std::string_view input) const -> std::optional<std::string>;

    /// Resolves either a 1-based index into `names()` or an alias.
    [[nodiscard]] auto resolve_selection(std::string_view input) const
        -> std::optional<std::string>;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /// Persona names in display order.
    [[nodiscard]] auto names() const -> const std::vector<std::string>& {
        return aliases_.canonical_names();
    }

    [[nodiscard]] auto groups() const -> const std::vector<PersonaGroup>& {
        return groups_;
    }

    /// Name of the first group listing `name`, if any.
    [[nodiscard]] auto group_of(std::string_view name) const -> std::optional<std::string>;

    /// Aliases of `name`, excluding the name itself.
    [[nodiscard]] auto aliases_of(std::string_view name) const -> std::vector<std::string>;

    /// Uniform pick among personas other than `exclude`; the full set is
    /// used when excluding would leave nothing.
    [[nodiscard]] auto pick_random(std::string_view exclude, std::mt19937& rng) const
        -> std::string;

    /// "All personas" listing, numbered from 1.
    [[nodiscard]] auto format_list() const -> std::string;

    /// Personas grouped by group name.
    [[nodiscard]] auto format_groups() const -> std::string;

    /// Detail card for one persona: aliases and group.
    [[nodiscard]] auto format_detail(std::string_view name) const -> std::string;

private:
    AliasTable aliases_;
    std::vector<PersonaGroup> groups_;
};

} // namespace pjsk::card

#endif // PJSK_CARD_CATALOG_HPP

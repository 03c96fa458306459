//! # Command Vocabulary
//!
//! The non-persona alias tables: command names, size variants, curve
//! variants and directions for the interpreter, plus the persona listing
//! subcommands. Built once at startup and shared read-only.

#ifndef PJSK_CARD_VOCABULARY_HPP
#define PJSK_CARD_VOCABULARY_HPP

#include "card/alias_table.hpp"

namespace pjsk::card {

// Canonical command names
inline constexpr const char* CMD_TEXT = "text";
inline constexpr const char* CMD_FONT_SIZE = "font_size";
inline constexpr const char* CMD_LINE_SPACING = "line_spacing";
inline constexpr const char* CMD_CURVE = "curve";
inline constexpr const char* CMD_POSITION = "position";
inline constexpr const char* CMD_ROLE = "role";

// Canonical listing subcommands
inline constexpr const char* LIST_ALL = "all";
inline constexpr const char* LIST_GROUPS = "groups";
inline constexpr const char* LIST_EXPAND = "expand";

/// Alias groups for each vocabulary table.
struct VocabularyGroups {
    AliasGroups commands;
    AliasGroups size_variants;
    AliasGroups curve_variants;
    AliasGroups directions;
    AliasGroups list_subcommands;

    /// The Chinese and English spellings accepted out of the box.
    [[nodiscard]] static auto builtin() -> VocabularyGroups;
};

/// Immutable set of alias tables used by `CommandInterpreter`.
struct CommandVocabulary {
    AliasTable commands;
    AliasTable size_variants;
    AliasTable curve_variants;
    AliasTable directions;
    AliasTable list_subcommands;

    /// Builds every table, failing on the first ambiguous alias.
    [[nodiscard]] static auto build(const VocabularyGroups& groups)
        -> Result<CommandVocabulary, AliasConflict>;

    /// Builds the built-in vocabulary.
    ///
    /// # Panics
    ///
    /// Throws `std::logic_error` if the built-in groups are ambiguous.
    [[nodiscard]] static auto builtin() -> CommandVocabulary;
};

} // namespace pjsk::card

#endif // PJSK_CARD_VOCABULARY_HPP

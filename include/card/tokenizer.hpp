//! # Command Tokenizer
//!
//! Splits raw command text into the pieces the interpreter dispatches on,
//! and parses the loosely formatted numbers users type.
//!
//! ```text
//! "字号.大 2"      -> first token "字号.大", remainder "2"
//! "字号.大"        -> head "字号", variants ["大"]
//! "-n \"a b\" -c"  -> args ["-n", "a b", "-c"]
//! ```

#ifndef PJSK_CARD_TOKENIZER_HPP
#define PJSK_CARD_TOKENIZER_HPP

#include "card/adjust_error.hpp"
#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pjsk::card {

/// A message split at its first whitespace run.
struct FirstToken {
    std::string token;
    std::string remainder;
};

/// A command token split on '.'.
struct DottedToken {
    std::string head;
    std::vector<std::string> variants;
};

/// Splits `message` at the first whitespace run. The message is trimmed
/// first; both parts are empty for blank input, and the remainder is
/// trimmed.
[[nodiscard]] auto extract_first_token(std::string_view message) -> FirstToken;

/// Splits `token` on '.', dropping empty segments. The first segment is the
/// head; an empty or all-dot token yields `{"", {}}`.
[[nodiscard]] auto split_dotted(std::string_view token) -> DottedToken;

/// Splits on whitespace. A run enclosed in matching single or double quotes
/// (ASCII or CJK “ ” quotes) stays one token with the quotes removed.
[[nodiscard]] auto split_args(std::string_view remainder) -> std::vector<std::string>;

/// Parses an integer, accepting a "px" suffix, full-width signs and a
/// fractional part (truncated toward zero).
[[nodiscard]] auto parse_int(std::string_view raw) -> Result<long long, AdjustError>;

/// `parse_int` that also rejects values <= 0.
[[nodiscard]] auto parse_positive_int(std::string_view raw) -> Result<long long, AdjustError>;

/// Parses a decimal, accepting a "倍"/"x" multiplier marker and a decimal
/// comma.
[[nodiscard]] auto parse_float(std::string_view raw) -> Result<double, AdjustError>;

} // namespace pjsk::card

#endif // PJSK_CARD_TOKENIZER_HPP

//! # Adjustment Errors
//!
//! The user-facing failure taxonomy of the interpreter. Both kinds carry a
//! message suitable for showing to the requester verbatim.

#ifndef PJSK_CARD_ADJUST_ERROR_HPP
#define PJSK_CARD_ADJUST_ERROR_HPP

#include <string>

namespace pjsk::card {

enum class AdjustErrorKind {
    MissingState, ///< No card exists yet for the session
    Validation    ///< Malformed or out-of-vocabulary input
};

/// A failed adjustment. The configuration it was applied to is unchanged.
struct AdjustError {
    AdjustErrorKind kind;
    std::string message;

    static auto missing_state() -> AdjustError {
        return AdjustError{AdjustErrorKind::MissingState,
                           "no card exists for this session yet, create a card first"};
    }

    static auto validation(std::string msg) -> AdjustError {
        return AdjustError{AdjustErrorKind::Validation, std::move(msg)};
    }

    [[nodiscard]] auto is_missing_state() const -> bool {
        return kind == AdjustErrorKind::MissingState;
    }

    [[nodiscard]] auto to_string() const -> std::string {
        return message;
    }
};

} // namespace pjsk::card

#endif // PJSK_CARD_ADJUST_ERROR_HPP

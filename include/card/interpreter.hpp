//! # Command Interpreter
//!
//! Turns an adjustment command into a validated mutation of a
//! `RenderConfig`.
//!
//! ## Dispatch
//!
//! The head of the dotted command token is resolved through the command
//! alias table to one of six rules:
//!
//! | Rule           | Input                                   |
//! |----------------|-----------------------------------------|
//! | `text`         | whole remainder                         |
//! | `font_size`    | `.increase`/`.decrease` or an integer   |
//! | `line_spacing` | `.increase`/`.decrease` or a decimal    |
//! | `curve`        | `.on`/`.off`/`.toggle`, or an argument  |
//! | `position`     | a direction, then an optional step      |
//! | `role`         | `-r` or a persona alias                 |
//!
//! Each rule computes the new value from the current one and assigns it
//! once, so a failed command leaves the configuration untouched.

#ifndef PJSK_CARD_INTERPRETER_HPP
#define PJSK_CARD_INTERPRETER_HPP

#include "card/adjust_error.hpp"
#include "card/catalog.hpp"
#include "card/render_config.hpp"
#include "card/vocabulary.hpp"
#include "common.hpp"

#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace pjsk::card {

/// Applies adjustment commands to card configurations.
///
/// The interpreter holds only shared read-only tables and a random engine;
/// the configuration is passed in per call.
class CommandInterpreter {
public:
    /// Creates an interpreter.
    ///
    /// # Arguments
    ///
    /// * `vocabulary` - Command, variant and direction aliases
    /// * `catalog` - Persona set used by the role rule
    /// * `limits` - Bounds and step sizes
    /// * `seed` - Seed for random persona selection
    CommandInterpreter(Rc<const CommandVocabulary> vocabulary, Rc<const PersonaCatalog> catalog,
                       CardLimits limits, uint32_t seed = std::random_device{}());

    /// Applies one command.
    ///
    /// # Arguments
    ///
    /// * `config` - Configuration to mutate; untouched on error
    /// * `command_token` - Head of the dotted token (e.g. "字号")
    /// * `variants` - Dotted segments after the head (e.g. {"大"})
    /// * `remainder` - Free text after the first token
    ///
    /// # Returns
    ///
    /// A short confirmation, or a `Validation` error.
    [[nodiscard]] auto apply(RenderConfig& config, std::string_view command_token,
                             const std::vector<std::string>& variants,
                             std::string_view remainder) -> Result<std::string, AdjustError>;

    /// Tokenizes `message` and applies it.
    [[nodiscard]] auto apply_message(RenderConfig& config, std::string_view message)
        -> Result<std::string, AdjustError>;

    [[nodiscard]] auto limits() const -> const CardLimits& {
        return limits_;
    }

    [[nodiscard]] auto catalog() const -> const PersonaCatalog& {
        return *catalog_;
    }

private:
    Rc<const CommandVocabulary> vocabulary_;
    Rc<const PersonaCatalog> catalog_;
    CardLimits limits_;
    std::mt19937 rng_;

    auto execute_text(RenderConfig& config, std::string_view remainder)
        -> Result<std::string, AdjustError>;
    auto execute_font_size(RenderConfig& config, const std::string* variant,
                           const std::vector<std::string>& args)
        -> Result<std::string, AdjustError>;
    auto execute_line_spacing(RenderConfig& config, const std::string* variant,
                              const std::vector<std::string>& args)
        -> Result<std::string, AdjustError>;
    auto execute_curve(RenderConfig& config, const std::string* variant,
                       const std::vector<std::string>& args) -> std::string;
    auto execute_position(RenderConfig& config, const std::vector<std::string>& variants,
                          const std::vector<std::string>& args)
        -> Result<std::string, AdjustError>;
    auto execute_role(RenderConfig& config, std::string_view remainder,
                      const std::vector<std::string>& args) -> Result<std::string, AdjustError>;
};

} // namespace pjsk::card

#endif // PJSK_CARD_INTERPRETER_HPP

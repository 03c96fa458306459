//! # CLI Utilities
//!
//! Option parsing and help output shared by the command handlers.

#pragma once

#include "common.hpp"
#include "session/session_key.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pjsk::cli {

inline constexpr const char* DEFAULT_CONFIG_PATH = "config/pjsk.toml";
inline constexpr const char* DEFAULT_CHANNEL = "cli";

/// Options that come before the command name.
struct CliOptions {
    std::string config_path = DEFAULT_CONFIG_PATH;
    /// True when `--config=` was given; a bad file is then an error instead
    /// of a fallback to defaults.
    bool config_explicit = false;
    session::RequesterInfo requester{DEFAULT_CHANNEL, std::nullopt, std::nullopt, std::nullopt};
    /// True when the log level came from argv or PJSK_LOG.
    bool log_level_explicit = false;
    bool log_file_explicit = false;

    /// Empty when only options were given.
    std::string command;
    /// Arguments after the command, verbatim.
    std::vector<std::string> args;
    /// Index of the command in argv; options are parsed before it only.
    int command_index = 0;
};

/// Parses argv.
///
/// # Returns
///
/// The options, or a message describing the first unknown option.
[[nodiscard]] auto parse_cli_options(int argc, char* argv[]) -> Result<CliOptions, std::string>;

/// Joins arguments into one message, quoting any that contain whitespace
/// so the tokenizer sees them as single tokens again.
[[nodiscard]] auto join_args(const std::vector<std::string>& args) -> std::string;

void print_usage();

void print_version();

} // namespace pjsk::cli

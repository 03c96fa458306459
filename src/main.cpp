//! # pjsk Entry Point
//!
//! `main()` only delegates to the CLI driver, which parses options, wires
//! the configuration, stores and renderer together, and runs one command.
//!
//! ## Usage
//!
//! ```bash
//! pjsk draw -n "hello" -s 48     # Create or refresh the card
//! pjsk adjust 字号.大             # Step the font size up
//! pjsk list all                  # List every persona
//! ```

#include "cli/driver.hpp"

/// Main entry point for the pjsk host.
///
/// @param argc Argument count from the operating system
/// @param argv Argument vector (null-terminated strings)
/// @return Exit code: 0 for success, non-zero for errors
int main(int argc, char* argv[]) {
    return pjsk_main(argc, argv);
}

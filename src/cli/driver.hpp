//! # CLI Driver Interface
//!
//! `pjsk_main()` dispatches to the command named by the first positional
//! argument.

#pragma once

// Host entry point: parses options, runs one command, returns the exit code
int pjsk_main(int argc, char* argv[]);

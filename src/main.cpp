//! # notate Entry Point
//!
//! The `main()` function only delegates to the CLI driver
//! (`cli/driver.hpp`), which parses arguments, dispatches to the
//! subcommands and reports errors.
//!
//! ## Usage
//!
//! ```bash
//! notate expand classes.json --pretty   # Expand annotations into descriptors
//! notate parse "/** !Route GET, / */"   # Show evaluated directive parameters
//! notate list                           # List registered annotation kinds
//! ```

#include "cli/driver.hpp"

/// Main entry point for notate.
///
/// @param argc Argument count from the operating system
/// @param argv Argument vector (null-terminated strings)
/// @return Exit code: 0 for success, non-zero for errors
int main(int argc, char* argv[]) {
    return notate_main(argc, argv);
}

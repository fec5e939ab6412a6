//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for the notate CLI.
//! It parses command-line arguments and routes to the appropriate command handler.
//!
//! ## Architecture
//!
//! ```text
//! notate_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ expand         → run_expand()
//!   ├─ parse          → run_parse()
//!   └─ list           → run_list()
//! ```
//!
//! ## Global Flags
//!
//! These flags are available for all commands:
//! - `--verbose` / `-v`: Log at Info (`-vv` Debug, `-vvv` Trace)
//! - `--pretty`: Indent JSON output
//! - `--diagnostic-format=json`: Emit diagnostics as JSON lines
//! - `--log-*`: Logging options, see `log/log.hpp`

#include "cli/commands.hpp"
#include "cli/driver.hpp"
#include "cli/utils.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>

/// Main entry point for the notate CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                   |
/// |------|-------------------------------------------|
/// | 0    | Success                                   |
/// | 1    | Annotation errors, bad input or bad usage |
int notate_main(int argc, char* argv[]) {
    using namespace notate;
    using namespace notate::cli;

    if (argc < 2) {
        print_usage();
        return 0;
    }

    auto log_config = log::parse_log_options(argc, argv);
    if (is_err(log_config)) {
        std::cerr << "error: " << unwrap_err(log_config) << "\n";
        return 1;
    }
    for (const auto& warning : log::Logger::init(unwrap(log_config))) {
        std::cerr << "warning: " << warning << "\n";
    }

    std::string command = argv[1];

    auto flags = parse_command_flags(argc, argv);
    if (is_err(flags)) {
        std::cerr << "error: " << unwrap_err(flags) << "\n";
        std::cerr << "Run 'notate --help' for usage.\n";
        return 1;
    }
    const auto& args = unwrap(flags);

    NOTATE_LOG_DEBUG("cli", "Command '" << command << "' with " << args.size()
                                        << " argument(s)");

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    if (command == "expand") {
        if (args.size() != 1) {
            std::cerr << "Usage: notate expand <manifest.json> [--pretty] "
                         "[--diagnostic-format=json]\n";
            return 1;
        }
        return run_expand(args[0]);
    }

    if (command == "parse") {
        if (args.size() != 1) {
            std::cerr << "Usage: notate parse <comment-text | @file> [--pretty]\n";
            return 1;
        }
        return run_parse(args[0]);
    }

    if (command == "list") {
        return run_list();
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'notate --help' for usage.\n";
    return 1;
}

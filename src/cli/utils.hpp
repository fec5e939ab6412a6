//! # CLI Utilities Interface
//!
//! | Function              | Description                          |
//! |-----------------------|--------------------------------------|
//! | `read_file()`         | Read entire file to string           |
//! | `parse_command_flags()` | Apply global flags, collect operands |
//! | `format_diagnostic()` | Render an annotation error for stderr |
//! | `print_usage()`       | Print CLI help text                  |
//! | `print_version()`     | Print version                        |

#pragma once

#include "annotation/error.hpp"
#include "common.hpp"

#include <optional>
#include <string>
#include <vector>

namespace notate::cli {

// File I/O
std::optional<std::string> read_file(const std::string& path);

// Reads argv[2..]: sets NotateOptions from `--pretty` and
// `--diagnostic-format=`, skips logging flags and returns the operands.
// Any other dash argument is an error.
Result<std::vector<std::string>, std::string> parse_command_flags(int argc, char* argv[]);

// Diagnostics, honoring NotateOptions::diagnostic_format
std::string format_diagnostic(const annotation::AnnotationError& error);

// Help text
void print_usage();
void print_version();

} // namespace notate::cli

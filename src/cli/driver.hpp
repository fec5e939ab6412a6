//! # CLI Driver Interface
//!
//! This header defines the entry point of the `notate` executable.
//!
//! ## Entry Point
//!
//! `notate_main()` dispatches to the command handler named by argv[1].

#pragma once

// Dispatches to the command handlers in cli/commands.hpp
int notate_main(int argc, char* argv[]);

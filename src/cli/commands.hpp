//! # CLI Commands
//!
//! | Command  | Function       | Output |
//! |----------|----------------|--------|
//! | `expand` | `run_expand()` | JSON array of class descriptors |
//! | `parse`  | `run_parse()`  | One line per directive |
//! | `list`   | `run_list()`   | Registered kinds with usage |
//!
//! The `*_to` variants write to caller-supplied streams so the commands can
//! be driven from tests.

#pragma once

#include "annotation/registry.hpp"
#include "cli/manifest.hpp"

#include <iosfwd>
#include <string>

namespace notate::cli {

/// Expands every class in `manifest`. Descriptors go to `out`, one
/// diagnostic per line to `err`. Returns 1 if any directive failed.
int expand_manifest_to(const Manifest& manifest, const annotation::AnnotationRegistry& registry,
                       std::ostream& out, std::ostream& err);

/// Prints each directive in `comment` with its evaluated parameters.
/// Returns 1 if any argument text fails to evaluate.
int parse_comment_to(const std::string& comment, std::ostream& out, std::ostream& err);

/// Prints the registered kinds, their targets and usage.
void list_annotations_to(const annotation::AnnotationRegistry& registry, std::ostream& out);

int run_expand(const std::string& manifest_path);
int run_parse(const std::string& text_or_file);
int run_list();

} // namespace notate::cli

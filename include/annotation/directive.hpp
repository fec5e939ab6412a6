//! # Directive Extraction
//!
//! Scans a documentation comment for `!Name argument-text` directives.
//!
//! ## Grammar
//!
//! ```text
//! directive     := '!' identifier argument-text
//! identifier    := [A-Za-z_][A-Za-z0-9_]*
//! argument-text := until '*/' or newline, whichever comes first
//! ```
//!
//! The `!` must start the text or follow whitespace, `*` or `/`, so
//! exclamations in prose are not picked up.
//!
//! ## Example
//!
//! ```cpp
//! auto directives = extract_directives("/** !Column integer, nullable: true */");
//! // directives[0].name == "Column"
//! // directives[0].argument_text == "integer, nullable: true"
//! ```

#ifndef NOTATE_ANNOTATION_DIRECTIVE_HPP
#define NOTATE_ANNOTATION_DIRECTIVE_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace notate::annotation {

/// One directive as it appears in a comment, before evaluation.
struct RawInvocation {
    std::string name;          ///< Identifier after `!`.
    std::string argument_text; ///< Unparsed arguments, whitespace-trimmed.
    size_t offset = 0;         ///< Byte offset of the `!` in the comment.
};

/// Extracts all directives from a comment block, in source order.
///
/// Returns an empty vector if the comment has none; malformed headers
/// (a `!` with no identifier) are skipped.
[[nodiscard]] auto extract_directives(std::string_view comment) -> std::vector<RawInvocation>;

} // namespace notate::annotation

#endif // NOTATE_ANNOTATION_DIRECTIVE_HPP

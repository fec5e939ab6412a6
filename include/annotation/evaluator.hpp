//! # Parameter Evaluator
//!
//! Turns directive argument text into a `ParameterList`. The text is a
//! literal-list expression evaluated by a closed recursive-descent
//! interpreter; nothing in it is ever executed.
//!
//! ## Evaluation Steps
//!
//! 1. The text is wrapped in an implicit outer group: `a, b` reads as `(a, b)`
//! 2. Quoted literals (`'...'` or `"..."`) are lifted out into placeholders
//!    so that normalization cannot touch their content
//! 3. Whitespace around `(`, `)`, `,` and `:` is collapsed
//! 4. Remaining barewords are string literals (`GET` is `'GET'`), except
//!    `true`/`false` and numerals, which become booleans and numbers
//! 5. The resulting list is interpreted: `key: value` entries become keyed
//!    parameters (lower-cased keys), all others positional
//!
//! ## Nesting
//!
//! One explicit level of grouping is supported: `methods: (GET, POST)` is
//! a keyed list. A group inside a group is a `ParseError`, as is a
//! `key: value` pair inside a group.
//!
//! ## Example
//!
//! ```cpp
//! auto result = evaluate_arguments("GET, '/users/:id', name: 'users.show'");
//! // positional = ["GET", "/users/:id"], keyed = {name: "users.show"}
//! ```

#ifndef NOTATE_ANNOTATION_EVALUATOR_HPP
#define NOTATE_ANNOTATION_EVALUATOR_HPP

#include "annotation/value.hpp"
#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace notate::annotation {

/// Argument text that does not reduce to a valid literal list.
struct ParseError {
    std::string message;       ///< What went wrong.
    std::string argument_text; ///< The offending argument text, verbatim.

    [[nodiscard]] auto to_string() const -> std::string {
        return message + " in \"" + argument_text + "\"";
    }
};

/// Argument text with its quoted literals lifted out.
///
/// Each literal is replaced in `text` by `PLACEHOLDER`; `literals` holds the
/// unescaped contents in order of appearance.
struct MaskedText {
    static constexpr char PLACEHOLDER = '\x1A';

    std::string text;
    std::vector<std::string> literals;
};

/// Lifts quoted literals out of `text`.
///
/// Inside a literal, `\'`, `\"` and `\\` unescape to the quoted character;
/// any other backslash is kept verbatim.
[[nodiscard]] auto mask_literals(std::string_view text) -> Result<MaskedText, ParseError>;

/// Removes whitespace immediately before or after `(`, `)`, `,` and `:`.
[[nodiscard]] auto collapse_separators(std::string_view text) -> std::string;

/// Evaluates directive argument text into parameters.
[[nodiscard]] auto evaluate_arguments(std::string_view text) -> Result<ParameterList, ParseError>;

} // namespace notate::annotation

#endif // NOTATE_ANNOTATION_EVALUATOR_HPP

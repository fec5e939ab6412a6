//! # Annotation Errors
//!
//! The single structured diagnostic produced when an annotation cannot be
//! applied. Errors are returned in `Result` values, never thrown.
//!
//! | Kind | Raised by |
//! |------|-----------|
//! | `Parse` | Parameter evaluator |
//! | `UnknownAnnotation` | Registry lookup |
//! | `Invalid` | Applicability and validation checks (batched) |

#ifndef NOTATE_ANNOTATION_ERROR_HPP
#define NOTATE_ANNOTATION_ERROR_HPP

#include "json/json_value.hpp"

#include <string>
#include <vector>

namespace notate::annotation {

enum class AnnotationErrorKind { Parse, UnknownAnnotation, Invalid };

/// Returns "parse", "unknown-annotation" or "invalid".
[[nodiscard]] auto error_kind_name(AnnotationErrorKind kind) -> const char*;

struct AnnotationError {
    AnnotationErrorKind kind = AnnotationErrorKind::Invalid;
    std::string annotation;          ///< Canonical name, e.g. "RouteAnnotation".
    std::string message;             ///< Full composed diagnostic.
    std::vector<std::string> errors; ///< Individual messages, for `Invalid`.
    std::string file;
    int line = 0;
    bool type_error = false; ///< An applicability mismatch is among `errors`.

    /// `file:line: message`, or just `message` without a location.
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto to_json() const -> json::JsonValue;
};

} // namespace notate::annotation

#endif // NOTATE_ANNOTATION_ERROR_HPP

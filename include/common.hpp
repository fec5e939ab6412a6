//! # Common Definitions
//!
//! Version constants, the host options shared by the CLI and the library, and
//! the `Result`/`Box` vocabulary every other header builds on.
//!
//! Errors never travel as exceptions: each fallible operation returns a
//! `Result<T, E>` whose error side carries the text a user will read.

#ifndef NOTATE_COMMON_HPP
#define NOTATE_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace notate {

constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Host Options
// ============================================================================

/// How annotation diagnostics are written.
enum class DiagnosticFormat {
    Text, ///< `file:line: error: message`
    JSON  ///< One JSON object per line
};

/// Output options set once by the host before expansion.
struct NotateOptions {
    static inline DiagnosticFormat diagnostic_format = DiagnosticFormat::Text;

    /// Indent JSON written to stdout.
    static inline bool pretty_output = false;
};

// ============================================================================
// Result
// ============================================================================

/// Either a value or an error.
///
/// ```cpp
/// auto params = evaluate_arguments("GET, '/users'");
/// if (is_err(params)) {
///     report(unwrap_err(params).to_string());
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Throws `std::bad_variant_access` when `result` holds an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Ownership
// ============================================================================

template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace notate

#endif // NOTATE_COMMON_HPP

//! # JSON Parser
//!
//! A lexer and recursive descent parser producing `JsonValue` trees. Used by
//! the CLI host to read class manifests.
//!
//! ## Features
//!
//! - **Integer detection**: Numbers without decimals/exponents are parsed as integers
//! - **Precise errors**: Every error carries line/column information
//! - **Depth limiting**: Deeply nested input is rejected instead of overflowing the stack
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"name": "User", "line": 3})");
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     std::cout << json.get("name")->as_string() << "\n";
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << "\n";
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_value.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace notate::json {

/// The first problem found in a document, located by 1-based line and column.
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;

    /// `line L, column C: message`
    [[nodiscard]] auto to_string() const -> std::string {
        return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
               message;
    }
};

/// Token types for the JSON lexer.
enum class JsonTokenKind : uint8_t {
    LBrace,      ///< `{`
    RBrace,      ///< `}`
    LBracket,    ///< `[`
    RBracket,    ///< `]`
    Colon,       ///< `:`
    Comma,       ///< `,`
    String,      ///< `"..."`
    IntNumber,   ///< `123`, `-456`
    FloatNumber, ///< `1.5`, `1e10`
    True,        ///< `true`
    False,       ///< `false`
    Null,        ///< `null`
    Eof,         ///< End of input
    Error        ///< Lexer error, see `string_value` for the message
};

/// A token produced by the JSON lexer.
struct JsonToken {
    JsonTokenKind kind;
    size_t line;
    size_t column;

    /// Unescaped content for `String`, message for `Error`.
    std::string string_value;

    int64_t int_value = 0;
    double float_value = 0.0;
};

/// JSON lexer over a borrowed input buffer.
class JsonLexer {
public:
    explicit JsonLexer(std::string_view input);

    /// Returns the next token; `Eof` once the input is exhausted.
    auto next_token() -> JsonToken;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();
    auto make_token(JsonTokenKind kind, size_t line, size_t column) -> JsonToken;
    auto make_error(std::string message, size_t line, size_t column) -> JsonToken;
    auto scan_string() -> JsonToken;
    auto scan_number() -> JsonToken;
    auto scan_keyword() -> JsonToken;
};

/// Recursive descent JSON parser.
class JsonParser {
public:
    /// Maximum nesting depth of arrays and objects.
    static constexpr size_t MAX_DEPTH = 256;

    explicit JsonParser(std::string_view input);

    /// Parses a complete document; trailing content is an error.
    auto parse() -> Result<JsonValue, JsonError>;

private:
    JsonLexer lexer_;
    JsonToken current_;
    size_t depth_ = 0;

    void advance();
    auto error_at(const JsonToken& token, const std::string& message) -> JsonError;
    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
};

/// Parses a JSON document.
///
/// # Returns
///
/// The parsed value, or a `JsonError` with line/column of the first problem.
auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace notate::json

//! # JSON Parser Implementation
//!
//! The parsing process has two stages:
//!
//! 1. **Lexing**: `JsonLexer` converts the input into tokens
//! 2. **Parsing**: `JsonParser` builds the `JsonValue` tree
//!
//! `\uXXXX` escapes are decoded to UTF-8; surrogate pairs are combined.

#include "json/json_parser.hpp"

#include <cerrno>
#include <cstdlib>

namespace notate::json {

namespace {

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

// ============================================================================
// JsonLexer
// ============================================================================

JsonLexer::JsonLexer(std::string_view input) : input_(input) {}

auto JsonLexer::peek() const -> char {
    return pos_ < input_.size() ? input_[pos_] : '\0';
}

auto JsonLexer::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonLexer::skip_whitespace() {
    while (pos_ < input_.size()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonLexer::make_token(JsonTokenKind kind, size_t line, size_t column) -> JsonToken {
    JsonToken tok;
    tok.kind = kind;
    tok.line = line;
    tok.column = column;
    return tok;
}

auto JsonLexer::make_error(std::string message, size_t line, size_t column) -> JsonToken {
    JsonToken tok = make_token(JsonTokenKind::Error, line, column);
    tok.string_value = std::move(message);
    return tok;
}

auto JsonLexer::next_token() -> JsonToken {
    skip_whitespace();

    size_t line = line_;
    size_t column = column_;

    if (pos_ >= input_.size()) {
        return make_token(JsonTokenKind::Eof, line, column);
    }

    char c = peek();
    switch (c) {
    case '{':
        advance();
        return make_token(JsonTokenKind::LBrace, line, column);
    case '}':
        advance();
        return make_token(JsonTokenKind::RBrace, line, column);
    case '[':
        advance();
        return make_token(JsonTokenKind::LBracket, line, column);
    case ']':
        advance();
        return make_token(JsonTokenKind::RBracket, line, column);
    case ':':
        advance();
        return make_token(JsonTokenKind::Colon, line, column);
    case ',':
        advance();
        return make_token(JsonTokenKind::Comma, line, column);
    case '"':
        return scan_string();
    default:
        break;
    }

    if (c == '-' || (c >= '0' && c <= '9')) {
        return scan_number();
    }
    if (c >= 'a' && c <= 'z') {
        return scan_keyword();
    }

    advance();
    return make_error(std::string("Unexpected character '") + c + "'", line, column);
}

auto JsonLexer::scan_string() -> JsonToken {
    size_t line = line_;
    size_t column = column_;
    advance(); // opening quote

    std::string value;
    while (pos_ < input_.size()) {
        char c = advance();

        if (c == '"') {
            JsonToken tok = make_token(JsonTokenKind::String, line, column);
            tok.string_value = std::move(value);
            return tok;
        }

        if (static_cast<unsigned char>(c) < 0x20) {
            return make_error("Unescaped control character in string", line_, column_ - 1);
        }

        if (c != '\\') {
            value += c;
            continue;
        }

        char escaped = advance();
        switch (escaped) {
        case '"':
            value += '"';
            break;
        case '\\':
            value += '\\';
            break;
        case '/':
            value += '/';
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            uint32_t cp = 0;
            for (int i = 0; i < 4; ++i) {
                int h = hex_value(advance());
                if (h < 0) {
                    return make_error("Invalid \\u escape", line_, column_);
                }
                cp = (cp << 4) | static_cast<uint32_t>(h);
            }
            // High surrogate must be followed by a low surrogate escape
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                if (advance() != '\\' || advance() != 'u') {
                    return make_error("Unpaired surrogate in \\u escape", line_, column_);
                }
                uint32_t low = 0;
                for (int i = 0; i < 4; ++i) {
                    int h = hex_value(advance());
                    if (h < 0) {
                        return make_error("Invalid \\u escape", line_, column_);
                    }
                    low = (low << 4) | static_cast<uint32_t>(h);
                }
                if (low < 0xDC00 || low > 0xDFFF) {
                    return make_error("Unpaired surrogate in \\u escape", line_, column_);
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            append_utf8(value, cp);
            break;
        }
        default:
            return make_error(std::string("Invalid escape '\\") + escaped + "'", line_,
                              column_ - 1);
        }
    }

    return make_error("Unterminated string", line, column);
}

auto JsonLexer::scan_number() -> JsonToken {
    size_t line = line_;
    size_t column = column_;
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }
    if (!(peek() >= '0' && peek() <= '9')) {
        return make_error("Expected digit", line_, column_);
    }
    while (peek() >= '0' && peek() <= '9') {
        advance();
    }
    if (peek() == '.') {
        is_float = true;
        advance();
        if (!(peek() >= '0' && peek() <= '9')) {
            return make_error("Expected digit after '.'", line_, column_);
        }
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!(peek() >= '0' && peek() <= '9')) {
            return make_error("Expected digit in exponent", line_, column_);
        }
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
    }

    std::string text(input_.substr(start, pos_ - start));

    if (!is_float) {
        errno = 0;
        long long v = std::strtoll(text.c_str(), nullptr, 10);
        if (errno != ERANGE) {
            JsonToken tok = make_token(JsonTokenKind::IntNumber, line, column);
            tok.int_value = static_cast<int64_t>(v);
            return tok;
        }
        // Out of int64 range: fall back to double
    }

    JsonToken tok = make_token(JsonTokenKind::FloatNumber, line, column);
    tok.float_value = std::strtod(text.c_str(), nullptr);
    return tok;
}

auto JsonLexer::scan_keyword() -> JsonToken {
    size_t line = line_;
    size_t column = column_;
    size_t start = pos_;
    while (peek() >= 'a' && peek() <= 'z') {
        advance();
    }
    auto word = input_.substr(start, pos_ - start);

    if (word == "true") {
        return make_token(JsonTokenKind::True, line, column);
    }
    if (word == "false") {
        return make_token(JsonTokenKind::False, line, column);
    }
    if (word == "null") {
        return make_token(JsonTokenKind::Null, line, column);
    }
    return make_error("Unknown keyword '" + std::string(word) + "'", line, column);
}

// ============================================================================
// JsonParser
// ============================================================================

JsonParser::JsonParser(std::string_view input) : lexer_(input) {
    advance();
}

void JsonParser::advance() {
    current_ = lexer_.next_token();
}

auto JsonParser::error_at(const JsonToken& token, const std::string& message) -> JsonError {
    if (token.kind == JsonTokenKind::Error) {
        return JsonError{token.string_value, token.line, token.column};
    }
    return JsonError{message, token.line, token.column};
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    auto value = parse_value();
    if (is_err(value)) {
        return value;
    }
    if (current_.kind != JsonTokenKind::Eof) {
        return error_at(current_, "Unexpected content after JSON value");
    }
    return value;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    switch (current_.kind) {
    case JsonTokenKind::LBrace:
        return parse_object();
    case JsonTokenKind::LBracket:
        return parse_array();
    case JsonTokenKind::String: {
        JsonValue v(std::move(current_.string_value));
        advance();
        return std::move(v);
    }
    case JsonTokenKind::IntNumber: {
        JsonValue v(current_.int_value);
        advance();
        return std::move(v);
    }
    case JsonTokenKind::FloatNumber: {
        JsonValue v(current_.float_value);
        advance();
        return std::move(v);
    }
    case JsonTokenKind::True:
        advance();
        return JsonValue(true);
    case JsonTokenKind::False:
        advance();
        return JsonValue(false);
    case JsonTokenKind::Null:
        advance();
        return JsonValue();
    case JsonTokenKind::Eof:
        return error_at(current_, "Unexpected end of input");
    default:
        return error_at(current_, "Expected a value");
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return error_at(current_, "Maximum nesting depth exceeded");
    }
    advance(); // '['

    JsonArray items;
    if (current_.kind == JsonTokenKind::RBracket) {
        advance();
        --depth_;
        return JsonValue(std::move(items));
    }

    while (true) {
        auto item = parse_value();
        if (is_err(item)) {
            return item;
        }
        items.push_back(std::move(unwrap(item)));

        if (current_.kind == JsonTokenKind::Comma) {
            advance();
            continue;
        }
        if (current_.kind == JsonTokenKind::RBracket) {
            advance();
            break;
        }
        return error_at(current_, "Expected ',' or ']' in array");
    }

    --depth_;
    return JsonValue(std::move(items));
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return error_at(current_, "Maximum nesting depth exceeded");
    }
    advance(); // '{'

    JsonObject members;
    if (current_.kind == JsonTokenKind::RBrace) {
        advance();
        --depth_;
        return JsonValue(std::move(members));
    }

    while (true) {
        if (current_.kind != JsonTokenKind::String) {
            return error_at(current_, "Expected string key in object");
        }
        std::string key = std::move(current_.string_value);
        advance();

        if (current_.kind != JsonTokenKind::Colon) {
            return error_at(current_, "Expected ':' after object key");
        }
        advance();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        members.insert_or_assign(std::move(key), std::move(unwrap(value)));

        if (current_.kind == JsonTokenKind::Comma) {
            advance();
            continue;
        }
        if (current_.kind == JsonTokenKind::RBrace) {
            advance();
            break;
        }
        return error_at(current_, "Expected ',' or '}' in object");
    }

    --depth_;
    return JsonValue(std::move(members));
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace notate::json

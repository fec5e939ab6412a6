#include "annotation/evaluator.hpp"

#include "log/log.hpp"

#include <charconv>
#include <cstdlib>

namespace notate::annotation {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto is_separator(char c) -> bool {
    return c == '(' || c == ')' || c == ',' || c == ':';
}

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

/// Matches `-?[0-9]+` or `-?[0-9]+\.[0-9]+`.
auto numeral_shape(std::string_view word, bool& is_float) -> bool {
    size_t i = 0;
    if (i < word.size() && word[i] == '-') {
        ++i;
    }
    size_t int_start = i;
    while (i < word.size() && is_digit(word[i])) {
        ++i;
    }
    if (i == int_start) {
        return false;
    }
    is_float = false;
    if (i == word.size()) {
        return true;
    }
    if (word[i] != '.') {
        return false;
    }
    ++i;
    size_t frac_start = i;
    while (i < word.size() && is_digit(word[i])) {
        ++i;
    }
    is_float = true;
    return i == word.size() && i > frac_start;
}

/// Coerces a bareword to its typed value.
auto coerce_bareword(const std::string& word) -> Value {
    auto lower = to_lower(word);
    if (lower == "true") {
        return Value(true);
    }
    if (lower == "false") {
        return Value(false);
    }

    bool is_float = false;
    if (numeral_shape(word, is_float)) {
        if (is_float) {
            return Value(std::strtod(word.c_str(), nullptr));
        }
        int64_t parsed = 0;
        auto [ptr, ec] = std::from_chars(word.data(), word.data() + word.size(), parsed);
        if (ec == std::errc() && ptr == word.data() + word.size()) {
            return Value(parsed);
        }
        // Out of int64 range: stays a string
    }
    return Value(word);
}

// ============================================================================
// Interpreter
// ============================================================================

/// Recursive-descent interpreter over collapsed, masked argument text.
///
/// ```text
/// group := '(' [ entry (',' entry)* ] ')'
/// entry := [ atom ':' ] item
/// item  := group | atom
/// atom  := PLACEHOLDER | bareword
/// ```
class Interpreter {
public:
    Interpreter(const MaskedText& masked, std::string_view original)
        : text_(masked.text), literals_(masked.literals), original_(original) {}

    auto run() -> Result<ParameterList, ParseError> {
        ParameterList params;

        if (!expect('(')) {
            return fail("expected '('");
        }
        if (peek() == ')') {
            ++pos_;
            return finish(std::move(params));
        }

        while (true) {
            auto err = top_level_entry(params);
            if (err) {
                return *err;
            }
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == ')') {
                ++pos_;
                break;
            }
            return unexpected();
        }
        return finish(std::move(params));
    }

private:
    const std::string& text_;
    const std::vector<std::string>& literals_;
    std::string_view original_;
    size_t pos_ = 0;
    size_t next_literal_ = 0;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= text_.size();
    }

    [[nodiscard]] auto peek() const -> char {
        return at_end() ? '\0' : text_[pos_];
    }

    auto expect(char c) -> bool {
        if (peek() != c) {
            return false;
        }
        ++pos_;
        return true;
    }

    [[nodiscard]] auto fail(const std::string& message) const -> ParseError {
        return ParseError{message, std::string(original_)};
    }

    [[nodiscard]] auto unexpected() const -> ParseError {
        if (at_end()) {
            return fail("unbalanced parentheses: missing ')'");
        }
        switch (peek()) {
        case ':':
            return fail("unexpected ':'");
        case '(':
            return fail("unexpected '('");
        case ')':
            return fail("unbalanced parentheses: unexpected ')'");
        default:
            return fail("unexpected text after value");
        }
    }

    auto finish(ParameterList params) -> Result<ParameterList, ParseError> {
        if (!at_end()) {
            return peek() == ')' ? fail("unbalanced parentheses: unexpected ')'")
                                 : fail("unexpected text after closing ')'");
        }
        return params;
    }

    /// Reads one atom. Returns `std::nullopt` (with `error` set) on failure.
    auto atom(std::optional<ParseError>& error) -> std::optional<Value> {
        char c = peek();
        if (c == MaskedText::PLACEHOLDER) {
            ++pos_;
            if (next_literal_ >= literals_.size()) {
                error = fail("internal literal mismatch");
                return std::nullopt;
            }
            if (!at_end() && !is_separator(peek())) {
                error = fail("unexpected text adjacent to quoted literal");
                return std::nullopt;
            }
            return Value(literals_[next_literal_++]);
        }

        if (at_end() || is_separator(c)) {
            error = at_end() ? fail("unbalanced parentheses: missing ')'")
                             : fail("empty parameter");
            return std::nullopt;
        }

        size_t start = pos_;
        while (!at_end() && !is_separator(peek())) {
            if (peek() == MaskedText::PLACEHOLDER) {
                error = fail("unexpected text adjacent to quoted literal");
                return std::nullopt;
            }
            ++pos_;
        }
        return coerce_bareword(text_.substr(start, pos_ - start));
    }

    /// Reads a parenthesized group one level deep.
    auto nested_group(std::optional<ParseError>& error) -> std::optional<Value> {
        ++pos_; // '('
        ValueList items;
        if (peek() == ')') {
            ++pos_;
            return Value(std::move(items));
        }

        while (true) {
            if (peek() == '(') {
                error = fail("nested groups deeper than one level are not supported");
                return std::nullopt;
            }
            auto item = atom(error);
            if (!item) {
                return std::nullopt;
            }
            if (peek() == ':') {
                error = fail("key: value pairs are not allowed inside a group");
                return std::nullopt;
            }
            items.push_back(std::move(*item));

            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == ')') {
                ++pos_;
                break;
            }
            error = unexpected();
            return std::nullopt;
        }
        return Value(std::move(items));
    }

    auto item(std::optional<ParseError>& error) -> std::optional<Value> {
        if (peek() == '(') {
            return nested_group(error);
        }
        return atom(error);
    }

    auto top_level_entry(ParameterList& params) -> std::optional<ParseError> {
        std::optional<ParseError> error;

        if (peek() == '(') {
            auto group = nested_group(error);
            if (!group) {
                return error;
            }
            if (peek() == ':') {
                return fail("a key must be a word or quoted string");
            }
            params.add_positional(std::move(*group));
            return std::nullopt;
        }

        auto first = atom(error);
        if (!first) {
            return error;
        }

        if (peek() != ':') {
            params.add_positional(std::move(*first));
            return std::nullopt;
        }

        ++pos_; // ':'
        if (at_end() || peek() == ',' || peek() == ')' || peek() == ':') {
            return fail("missing value after ':'");
        }
        auto value = item(error);
        if (!value) {
            return error;
        }
        params.set_keyed(first->to_string(), std::move(*value));
        return std::nullopt;
    }
};

} // namespace

auto mask_literals(std::string_view text) -> Result<MaskedText, ParseError> {
    MaskedText masked;
    masked.text.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == MaskedText::PLACEHOLDER) {
            return ParseError{"control character in argument text", std::string(text)};
        }
        if (c != '\'' && c != '"') {
            masked.text += c;
            ++i;
            continue;
        }

        char quote = c;
        std::string literal;
        ++i;
        bool closed = false;
        while (i < text.size()) {
            char d = text[i];
            if (d == '\\' && i + 1 < text.size()) {
                char next = text[i + 1];
                if (next == '\'' || next == '"' || next == '\\') {
                    literal += next;
                } else {
                    literal += d;
                    literal += next;
                }
                i += 2;
                continue;
            }
            if (d == quote) {
                closed = true;
                ++i;
                break;
            }
            literal += d;
            ++i;
        }
        if (!closed) {
            return ParseError{"unterminated quoted string", std::string(text)};
        }

        masked.text += MaskedText::PLACEHOLDER;
        masked.literals.push_back(std::move(literal));
    }

    return masked;
}

auto collapse_separators(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (is_separator(c)) {
            while (!out.empty() && is_space(out.back())) {
                out.pop_back();
            }
            out += c;
            while (i + 1 < text.size() && is_space(text[i + 1])) {
                ++i;
            }
            continue;
        }
        out += c;
    }
    return out;
}

auto evaluate_arguments(std::string_view text) -> Result<ParameterList, ParseError> {
    auto masked_result = mask_literals(text);
    if (is_err(masked_result)) {
        NOTATE_LOG_DEBUG("evaluator", unwrap_err(masked_result).to_string());
        return unwrap_err(masked_result);
    }
    auto masked = std::move(unwrap(masked_result));

    masked.text = collapse_separators("(" + masked.text + ")");

    NOTATE_LOG_TRACE("evaluator", "Evaluating '" << text << "' with " << masked.literals.size()
                                                 << " quoted literal(s)");

    Interpreter interpreter(masked, text);
    auto result = interpreter.run();
    if (is_err(result)) {
        NOTATE_LOG_DEBUG("evaluator", unwrap_err(result).to_string());
    }
    return result;
}

} // namespace notate::annotation

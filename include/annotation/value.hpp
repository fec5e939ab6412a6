//! # Annotation Values
//!
//! Typed parameter values produced by the evaluator and the ordered
//! positional/keyed `ParameterList` an annotation instance is initialized
//! with.
//!
//! | Kind | C++ Storage | Example source |
//! |------|-------------|----------------|
//! | String | `std::string` | `GET`, `'/users/:id'` |
//! | Boolean | `bool` | `true`, `FALSE` |
//! | Integer | `int64_t` | `42`, `-3` |
//! | Float | `double` | `1.5` |
//! | List | `std::vector<Value>` | `(GET, POST)` |

#ifndef NOTATE_ANNOTATION_VALUE_HPP
#define NOTATE_ANNOTATION_VALUE_HPP

#include "json/json_value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace notate::annotation {

struct Value;

/// An ordered group of values. Holds at most one level of grouping.
using ValueList = std::vector<Value>;

/// Discriminant of a `Value`, in variant order.
enum class ValueKind : uint8_t { String, Boolean, Integer, Float, List };

/// A typed annotation parameter value.
struct Value {
    std::variant<std::string, bool, int64_t, double, ValueList> data;

    Value() : data(std::string()) {}
    Value(const char* value) : data(std::string(value)) {}
    Value(std::string value) : data(std::move(value)) {}
    Value(bool value) : data(value) {}
    Value(int value) : data(static_cast<int64_t>(value)) {}
    Value(int64_t value) : data(value) {}
    Value(double value) : data(value) {}
    Value(ValueList value) : data(std::move(value)) {}

    [[nodiscard]] auto kind() const -> ValueKind {
        return static_cast<ValueKind>(data.index());
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<int64_t>(data);
    }
    [[nodiscard]] auto is_float() const -> bool {
        return std::holds_alternative<double>(data);
    }
    [[nodiscard]] auto is_list() const -> bool {
        return std::holds_alternative<ValueList>(data);
    }

    /// Throws `std::bad_variant_access` on a kind mismatch, as do the other accessors.
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_integer() const -> int64_t {
        return std::get<int64_t>(data);
    }
    [[nodiscard]] auto as_float() const -> double {
        return std::get<double>(data);
    }
    [[nodiscard]] auto as_list() const -> const ValueList& {
        return std::get<ValueList>(data);
    }

    /// Interprets the value as a flag: booleans as-is, the strings
    /// "true"/"yes"/"1" (any case) and non-zero integers as true.
    [[nodiscard]] auto truthy() const -> bool;

    /// Display form used in diagnostics and set-membership checks:
    /// strings verbatim, booleans as `true`/`false`, lists as `(a, b)`.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Canonical source form; re-evaluating it yields an equal value.
    [[nodiscard]] auto render() const -> std::string;

    [[nodiscard]] auto to_json() const -> json::JsonValue;

    [[nodiscard]] auto operator==(const Value& other) const -> bool;
    [[nodiscard]] auto operator!=(const Value& other) const -> bool {
        return !(*this == other);
    }
};

/// Returns the display name of a value kind ("string", "boolean", ...).
[[nodiscard]] auto kind_name(ValueKind kind) -> const char*;

/// Evaluated parameters of one directive.
///
/// Positional values keep source order. Keyed values are stored under
/// lower-cased keys in order of first appearance; setting an existing key
/// overwrites its value in place.
class ParameterList {
public:
    using Entry = std::pair<std::string, Value>;

    ParameterList() = default;

    void add_positional(Value value) {
        positional_.push_back(std::move(value));
    }

    /// Sets a keyed value. The key is lower-cased.
    void set_keyed(const std::string& key, Value value);

    [[nodiscard]] auto positional() const -> const std::vector<Value>& {
        return positional_;
    }

    [[nodiscard]] auto keyed() const -> const std::vector<Entry>& {
        return keyed_;
    }

    /// Looks up a keyed value (case-insensitive); `nullptr` if absent.
    [[nodiscard]] auto get(const std::string& key) const -> const Value*;

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    /// Positional value at `index`, or `nullptr` past the end.
    [[nodiscard]] auto at(size_t index) const -> const Value* {
        return index < positional_.size() ? &positional_[index] : nullptr;
    }

    /// Combined positional and keyed count.
    [[nodiscard]] auto size() const -> size_t {
        return positional_.size() + keyed_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return size() == 0;
    }

    [[nodiscard]] auto to_json() const -> json::JsonValue;

    [[nodiscard]] auto operator==(const ParameterList& other) const -> bool {
        return positional_ == other.positional_ && keyed_ == other.keyed_;
    }

private:
    std::vector<Value> positional_;
    std::vector<Entry> keyed_;
};

/// Renders a directive in canonical form: `!Name p1, p2, key: v`.
///
/// Strings are always quoted, so `extract_directives` followed by
/// `evaluate_arguments` reproduces the same name and parameters.
[[nodiscard]] auto render_directive(const std::string& name, const ParameterList& params)
    -> std::string;

/// ASCII lower-casing.
[[nodiscard]] auto to_lower(std::string s) -> std::string;

/// ASCII upper-casing.
[[nodiscard]] auto to_upper(std::string s) -> std::string;

} // namespace notate::annotation

#endif // NOTATE_ANNOTATION_VALUE_HPP

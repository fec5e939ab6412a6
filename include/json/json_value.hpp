//! # JSON Values
//!
//! The document model behind the class manifest read by the CLI, the
//! descriptor dump it writes, and JSON diagnostics.
//!
//! Objects keep their keys sorted, so two descriptors built from the same
//! input always serialize to the same bytes.
//!
//! ```cpp
//! auto route = json_object();
//! route.set("method", JsonValue("GET"));
//! route.set("path", JsonValue("users/list"));
//! route.to_string(); // {"method":"GET","path":"users/list"}
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace notate::json {

class JsonValue;

using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

/// A move-only JSON tree node. Use `clone()` for a deep copy.
///
/// Accessors for the wrong kind throw `std::bad_variant_access`, except
/// `get()` and `size()` which answer for any kind.
class JsonValue {
public:
    /// Order matches the storage variant.
    enum class Kind : uint8_t { Null, Bool, Integer, Float, String, Array, Object };

    JsonValue() = default;
    explicit JsonValue(std::nullptr_t) {}
    explicit JsonValue(bool value) : data_(value) {}
    explicit JsonValue(int value) : data_(static_cast<int64_t>(value)) {}
    explicit JsonValue(int64_t value) : data_(value) {}
    explicit JsonValue(double value) : data_(value) {}
    explicit JsonValue(const char* value) : data_(std::string(value)) {}
    explicit JsonValue(std::string value) : data_(std::move(value)) {}
    explicit JsonValue(std::string_view value) : data_(std::string(value)) {}
    explicit JsonValue(JsonArray value);
    explicit JsonValue(JsonObject value);

    JsonValue(JsonValue&&) = default;
    auto operator=(JsonValue&&) -> JsonValue& = default;
    JsonValue(const JsonValue&) = delete;
    auto operator=(const JsonValue&) -> JsonValue& = delete;

    [[nodiscard]] auto kind() const -> Kind {
        return static_cast<Kind>(data_.index());
    }

    [[nodiscard]] auto is_null() const -> bool {
        return kind() == Kind::Null;
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return kind() == Kind::Bool;
    }
    [[nodiscard]] auto is_integer() const -> bool {
        return kind() == Kind::Integer;
    }
    [[nodiscard]] auto is_float() const -> bool {
        return kind() == Kind::Float;
    }
    [[nodiscard]] auto is_number() const -> bool {
        return is_integer() || is_float();
    }
    [[nodiscard]] auto is_string() const -> bool {
        return kind() == Kind::String;
    }
    [[nodiscard]] auto is_array() const -> bool {
        return kind() == Kind::Array;
    }
    [[nodiscard]] auto is_object() const -> bool {
        return kind() == Kind::Object;
    }

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data_);
    }
    [[nodiscard]] auto as_i64() const -> int64_t {
        return std::get<int64_t>(data_);
    }
    /// Integers widen to double.
    [[nodiscard]] auto as_f64() const -> double;
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data_);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data_);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data_);
    }
    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data_);
    }
    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data_);
    }

    /// Member `key` of an object, or `nullptr` when absent or not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array()[index];
    }

    /// Element or member count; `0` for scalars.
    [[nodiscard]] auto size() const -> size_t;

    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    void set(const std::string& key, JsonValue value) {
        as_object_mut().insert_or_assign(key, std::move(value));
    }

    [[nodiscard]] auto to_string() const -> std::string;
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    [[nodiscard]] auto clone() const -> JsonValue;

    /// Structural equality; `1` and `1.0` are different values.
    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }

private:
    std::variant<std::monostate, bool, int64_t, double, std::string, Box<JsonArray>,
                 Box<JsonObject>>
        data_;
};

/// Escapes `text` for use between JSON double quotes.
[[nodiscard]] auto escape_json(std::string_view text) -> std::string;

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

} // namespace notate::json

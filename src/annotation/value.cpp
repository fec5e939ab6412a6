#include "annotation/value.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace notate::annotation {

auto to_lower(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

auto to_upper(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

auto kind_name(ValueKind kind) -> const char* {
    switch (kind) {
    case ValueKind::String:
        return "string";
    case ValueKind::Boolean:
        return "boolean";
    case ValueKind::Integer:
        return "integer";
    case ValueKind::Float:
        return "float";
    case ValueKind::List:
        return "list";
    }
    return "unknown";
}

namespace {

/// Shortest fixed-notation digits that read back to the same double.
/// Bareword floats have no exponent form, so neither does this.
auto format_float(double value) -> std::string {
    char buf[400];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    std::string s(buf, ptr);
    if (std::isfinite(value) && s.find('.') == std::string::npos) {
        s += ".0";
    }
    return s;
}

auto quote(const std::string& s) -> std::string {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '\'';
    return out;
}

/// A key the evaluator reads back unchanged when written bare. A leading
/// digit or `-` would coerce to a number (`007` becomes `7`).
auto is_plain_key(const std::string& key) -> bool {
    if (key.empty() || !(std::isalpha(static_cast<unsigned char>(key[0])) || key[0] == '_')) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

} // namespace

auto Value::truthy() const -> bool {
    switch (kind()) {
    case ValueKind::Boolean:
        return as_bool();
    case ValueKind::Integer:
        return as_integer() != 0;
    case ValueKind::Float:
        return as_float() != 0.0;
    case ValueKind::String: {
        auto lower = to_lower(as_string());
        return lower == "true" || lower == "yes" || lower == "1";
    }
    case ValueKind::List:
        return !as_list().empty();
    }
    return false;
}

auto Value::to_string() const -> std::string {
    switch (kind()) {
    case ValueKind::String:
        return as_string();
    case ValueKind::Boolean:
        return as_bool() ? "true" : "false";
    case ValueKind::Integer:
        return std::to_string(as_integer());
    case ValueKind::Float:
        return format_float(as_float());
    case ValueKind::List: {
        std::string out = "(";
        const auto& items = as_list();
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += items[i].to_string();
        }
        return out + ")";
    }
    }
    return "";
}

auto Value::render() const -> std::string {
    switch (kind()) {
    case ValueKind::String:
        return quote(as_string());
    case ValueKind::List: {
        std::string out = "(";
        const auto& items = as_list();
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += items[i].render();
        }
        return out + ")";
    }
    default:
        return to_string();
    }
}

auto Value::to_json() const -> json::JsonValue {
    switch (kind()) {
    case ValueKind::String:
        return json::JsonValue(as_string());
    case ValueKind::Boolean:
        return json::JsonValue(as_bool());
    case ValueKind::Integer:
        return json::JsonValue(as_integer());
    case ValueKind::Float:
        return json::JsonValue(as_float());
    case ValueKind::List: {
        auto arr = json::json_array();
        for (const auto& item : as_list()) {
            arr.push(item.to_json());
        }
        return arr;
    }
    }
    return json::JsonValue();
}

auto Value::operator==(const Value& other) const -> bool {
    if (kind() != other.kind()) {
        return false;
    }
    switch (kind()) {
    case ValueKind::String:
        return as_string() == other.as_string();
    case ValueKind::Boolean:
        return as_bool() == other.as_bool();
    case ValueKind::Integer:
        return as_integer() == other.as_integer();
    case ValueKind::Float:
        return as_float() == other.as_float();
    case ValueKind::List: {
        const auto& a = as_list();
        const auto& b = other.as_list();
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i] != b[i]) {
                return false;
            }
        }
        return true;
    }
    }
    return false;
}

// ============================================================================
// ParameterList
// ============================================================================

void ParameterList::set_keyed(const std::string& key, Value value) {
    auto lower = to_lower(key);
    for (auto& [k, v] : keyed_) {
        if (k == lower) {
            v = std::move(value);
            return;
        }
    }
    keyed_.emplace_back(std::move(lower), std::move(value));
}

auto ParameterList::get(const std::string& key) const -> const Value* {
    auto lower = to_lower(key);
    for (const auto& [k, v] : keyed_) {
        if (k == lower) {
            return &v;
        }
    }
    return nullptr;
}

auto ParameterList::to_json() const -> json::JsonValue {
    auto positional = json::json_array();
    for (const auto& value : positional_) {
        positional.push(value.to_json());
    }
    auto keyed = json::json_object();
    for (const auto& [key, value] : keyed_) {
        keyed.set(key, value.to_json());
    }

    auto out = json::json_object();
    out.set("positional", std::move(positional));
    out.set("keyed", std::move(keyed));
    return out;
}

auto render_directive(const std::string& name, const ParameterList& params) -> std::string {
    std::string out = "!" + name;
    bool first = true;
    auto separator = [&]() {
        out += first ? " " : ", ";
        first = false;
    };

    for (const auto& value : params.positional()) {
        separator();
        out += value.render();
    }
    for (const auto& [key, value] : params.keyed()) {
        separator();
        out += (is_plain_key(key) ? key : quote(key)) + ": " + value.render();
    }
    return out;
}

} // namespace notate::annotation

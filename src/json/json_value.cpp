//! # JSON Value Implementation
//!
//! Compact and indented serialization, deep copy and equality.
//!
//! Control characters without a short escape are written as `\u00XX`.
//! Non-finite doubles have no JSON form and are written as `null`.

#include "json/json_value.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace notate::json {

JsonValue::JsonValue(JsonArray value) : data_(make_box<JsonArray>(std::move(value))) {}

JsonValue::JsonValue(JsonObject value) : data_(make_box<JsonObject>(std::move(value))) {}

auto JsonValue::as_f64() const -> double {
    if (const auto* i = std::get_if<int64_t>(&data_)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(data_);
}

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    const auto* obj = std::get_if<Box<JsonObject>>(&data_);
    if (obj == nullptr) {
        return nullptr;
    }
    auto it = (*obj)->find(key);
    return it == (*obj)->end() ? nullptr : &it->second;
}

auto JsonValue::size() const -> size_t {
    switch (kind()) {
    case Kind::Array:
        return as_array().size();
    case Kind::Object:
        return as_object().size();
    default:
        return 0;
    }
}

// ============================================================================
// Serialization
// ============================================================================

auto escape_json(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    return out;
}

namespace {

auto format_number(double value) -> std::string {
    if (!std::isfinite(value)) {
        return "null";
    }
    // Shortest form that reads back to the same double
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        return "null";
    }
    std::string text(buf, ptr);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

class Writer {
public:
    Writer(std::ostringstream& out, int indent) : out_(out), indent_(indent) {}

    void write(const JsonValue& value, int depth) {
        switch (value.kind()) {
        case JsonValue::Kind::Null:
            out_ << "null";
            break;
        case JsonValue::Kind::Bool:
            out_ << (value.as_bool() ? "true" : "false");
            break;
        case JsonValue::Kind::Integer:
            out_ << value.as_i64();
            break;
        case JsonValue::Kind::Float:
            out_ << format_number(value.as_f64());
            break;
        case JsonValue::Kind::String:
            out_ << '"' << escape_json(value.as_string()) << '"';
            break;
        case JsonValue::Kind::Array:
            write_array(value.as_array(), depth);
            break;
        case JsonValue::Kind::Object:
            write_object(value.as_object(), depth);
            break;
        }
    }

private:
    std::ostringstream& out_;
    int indent_;

    void break_line(int depth) {
        if (indent_ > 0) {
            out_ << '\n' << std::string(static_cast<size_t>(indent_ * depth), ' ');
        }
    }

    void write_array(const JsonArray& items, int depth) {
        if (items.empty()) {
            out_ << "[]";
            return;
        }
        out_ << '[';
        for (size_t i = 0; i < items.size(); ++i) {
            out_ << (i == 0 ? "" : ",");
            break_line(depth + 1);
            write(items[i], depth + 1);
        }
        break_line(depth);
        out_ << ']';
    }

    void write_object(const JsonObject& members, int depth) {
        if (members.empty()) {
            out_ << "{}";
            return;
        }
        out_ << '{';
        bool first = true;
        for (const auto& [key, member] : members) {
            out_ << (first ? "" : ",");
            first = false;
            break_line(depth + 1);
            out_ << '"' << escape_json(key) << (indent_ > 0 ? "\": " : "\":");
            write(member, depth + 1);
        }
        break_line(depth);
        out_ << '}';
    }
};

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::ostringstream out;
    Writer(out, 0).write(*this, 0);
    return out.str();
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::ostringstream out;
    Writer(out, indent).write(*this, 0);
    return out.str();
}

// ============================================================================
// Copy and Comparison
// ============================================================================

auto JsonValue::clone() const -> JsonValue {
    switch (kind()) {
    case Kind::Null:
        return JsonValue();
    case Kind::Bool:
        return JsonValue(as_bool());
    case Kind::Integer:
        return JsonValue(as_i64());
    case Kind::Float:
        return JsonValue(std::get<double>(data_));
    case Kind::String:
        return JsonValue(as_string());
    case Kind::Array: {
        JsonArray items;
        items.reserve(as_array().size());
        for (const auto& item : as_array()) {
            items.push_back(item.clone());
        }
        return JsonValue(std::move(items));
    }
    case Kind::Object: {
        JsonObject members;
        for (const auto& [key, member] : as_object()) {
            members.emplace(key, member.clone());
        }
        return JsonValue(std::move(members));
    }
    }
    return JsonValue();
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (kind() != other.kind()) {
        return false;
    }
    switch (kind()) {
    case Kind::Null:
        return true;
    case Kind::Bool:
        return as_bool() == other.as_bool();
    case Kind::Integer:
        return as_i64() == other.as_i64();
    case Kind::Float:
        return std::get<double>(data_) == std::get<double>(other.data_);
    case Kind::String:
        return as_string() == other.as_string();
    case Kind::Array:
        return as_array() == other.as_array();
    case Kind::Object:
        return as_object() == other.as_object();
    }
    return false;
}

} // namespace notate::json

#include "descriptor/class_descriptor.hpp"

#include <algorithm>
#include <cctype>

namespace notate::descriptor {

auto relation_kind_name(RelationKind kind) -> const char* {
    switch (kind) {
    case RelationKind::HasMany:
        return "hasMany";
    case RelationKind::BelongsTo:
        return "belongsTo";
    }
    return "unknown";
}

auto delete_action_name(DeleteAction action) -> const char* {
    switch (action) {
    case DeleteAction::Unspecified:
        return "";
    case DeleteAction::Cascade:
        return "Cascade";
    case DeleteAction::Delete:
        return "Delete";
    case DeleteAction::Nullify:
        return "Nullify";
    }
    return "";
}

auto parse_delete_action(const std::string& name) -> std::optional<DeleteAction> {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "cascade") {
        return DeleteAction::Cascade;
    }
    if (lower == "delete") {
        return DeleteAction::Delete;
    }
    if (lower == "nullify") {
        return DeleteAction::Nullify;
    }
    return std::nullopt;
}

// ============================================================================
// JSON
// ============================================================================

auto RouteDef::to_json() const -> json::JsonValue {
    auto obj = json::json_object();
    obj.set("method", json::JsonValue(method));
    obj.set("path", json::JsonValue(path));
    obj.set("handler", json::JsonValue(handler));
    if (!name.empty()) {
        obj.set("name", json::JsonValue(name));
    }
    return obj;
}

auto ColumnDef::to_json() const -> json::JsonValue {
    auto obj = json::json_object();
    obj.set("property", json::JsonValue(property));
    obj.set("type", json::JsonValue(type));
    obj.set("primary_key", json::JsonValue(primary_key));
    obj.set("auto_increment", json::JsonValue(auto_increment));
    obj.set("nullable", json::JsonValue(nullable));
    if (default_value) {
        obj.set("default", json::JsonValue(*default_value));
    }
    return obj;
}

auto RelationDef::to_json() const -> json::JsonValue {
    auto obj = json::json_object();
    obj.set("kind", json::JsonValue(relation_kind_name(kind)));
    obj.set("name", json::JsonValue(name));
    obj.set("class", json::JsonValue(related_class));
    obj.set("foreign_key", json::JsonValue(foreign_key));
    if (!through.empty()) {
        obj.set("through", json::JsonValue(through));
    }
    if (on_delete != DeleteAction::Unspecified) {
        obj.set("on_delete", json::JsonValue(delete_action_name(on_delete)));
    }
    return obj;
}

// ============================================================================
// ClassDescriptor
// ============================================================================

auto ClassDescriptor::resolve_route_path(const std::string& path) const -> std::string {
    if (!path.empty() && path.front() == '/') {
        return path;
    }
    return route_prefix_ + path;
}

void ClassDescriptor::add_column(ColumnDef column) {
    if (column.primary_key) {
        primary_key_ = column.property;
    }
    columns_.push_back(std::move(column));
}

auto ClassDescriptor::find_column(const std::string& property) const -> const ColumnDef* {
    for (const auto& column : columns_) {
        if (column.property == property) {
            return &column;
        }
    }
    return nullptr;
}

auto ClassDescriptor::find_relation(const std::string& name) const -> const RelationDef* {
    for (const auto& relation : relations_) {
        if (relation.name == name) {
            return &relation;
        }
    }
    return nullptr;
}

auto ClassDescriptor::to_json() const -> json::JsonValue {
    auto obj = json::json_object();
    obj.set("class", json::JsonValue(class_name_));

    if (!route_prefix_.empty()) {
        obj.set("route_prefix", json::JsonValue(route_prefix_));
    }
    if (!routes_.empty()) {
        auto arr = json::json_array();
        for (const auto& route : routes_) {
            arr.push(route.to_json());
        }
        obj.set("routes", std::move(arr));
    }

    if (!table_.empty()) {
        obj.set("table", json::JsonValue(table_));
    }
    if (!source_.empty()) {
        obj.set("source", json::JsonValue(source_));
    }
    if (!primary_key_.empty()) {
        obj.set("primary_key", json::JsonValue(primary_key_));
    }
    if (!columns_.empty()) {
        auto arr = json::json_array();
        for (const auto& column : columns_) {
            arr.push(column.to_json());
        }
        obj.set("columns", std::move(arr));
    }
    if (!relations_.empty()) {
        auto arr = json::json_array();
        for (const auto& relation : relations_) {
            arr.push(relation.to_json());
        }
        obj.set("relations", std::move(arr));
    }
    return obj;
}

} // namespace notate::descriptor

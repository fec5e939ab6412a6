//! # Class Descriptor
//!
//! The mutable metadata record built for one class by expanding its
//! annotations. Routing and ORM consumers read it afterwards; this library
//! only appends to it and sets its bindings.
//!
//! ## Contents
//!
//! | Field | Set by |
//! |-------|--------|
//! | `routes` | `!Route` |
//! | `route_prefix` | `!Prefix` |
//! | `table` | `!Table` |
//! | `source` | `!Source` |
//! | `columns`, `primary_key` | `!Column` |
//! | `relations` | `!HasMany`, `!BelongsTo` |

#ifndef NOTATE_DESCRIPTOR_CLASS_DESCRIPTOR_HPP
#define NOTATE_DESCRIPTOR_CLASS_DESCRIPTOR_HPP

#include "json/json_value.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace notate::descriptor {

/// One routable handler.
struct RouteDef {
    std::string method;  ///< Upper-case HTTP method.
    std::string path;    ///< Full path, prefix applied.
    std::string handler; ///< Method name on the controller.
    std::string name;    ///< Optional route name.

    [[nodiscard]] auto to_json() const -> json::JsonValue;
    auto operator==(const RouteDef&) const -> bool = default;
};

/// One mapped property.
struct ColumnDef {
    std::string property;
    std::string type; ///< Lower-case column type, e.g. "integer".
    bool primary_key = false;
    bool auto_increment = false;
    bool nullable = true;
    std::optional<std::string> default_value;

    [[nodiscard]] auto to_json() const -> json::JsonValue;
    auto operator==(const ColumnDef&) const -> bool = default;
};

enum class RelationKind { HasMany, BelongsTo };

[[nodiscard]] auto relation_kind_name(RelationKind kind) -> const char*;

/// What happens to related rows when the owner is deleted.
enum class DeleteAction { Unspecified, Cascade, Delete, Nullify };

[[nodiscard]] auto delete_action_name(DeleteAction action) -> const char*;

/// Parses "Cascade", "Delete" or "Nullify" (any case).
[[nodiscard]] auto parse_delete_action(const std::string& name) -> std::optional<DeleteAction>;

struct RelationDef {
    RelationKind kind = RelationKind::HasMany;
    std::string name;          ///< Relation name as written, e.g. "posts".
    std::string related_class; ///< e.g. "Post".
    std::string foreign_key;   ///< e.g. "userId".
    std::string through;       ///< Join class for many-to-many; empty otherwise.
    DeleteAction on_delete = DeleteAction::Unspecified;

    [[nodiscard]] auto to_json() const -> json::JsonValue;
    auto operator==(const RelationDef&) const -> bool = default;
};

/// Metadata for one class under construction.
///
/// Owned by the caller driving expansion; annotations receive it by
/// reference for the duration of one pass and never retain it.
class ClassDescriptor {
public:
    ClassDescriptor() = default;
    explicit ClassDescriptor(std::string class_name) : class_name_(std::move(class_name)) {}

    [[nodiscard]] auto class_name() const -> const std::string& {
        return class_name_;
    }

    // ========================================================================
    // Routing
    // ========================================================================

    void add_route(RouteDef route) {
        routes_.push_back(std::move(route));
    }

    [[nodiscard]] auto routes() const -> const std::vector<RouteDef>& {
        return routes_;
    }

    void set_route_prefix(std::string prefix) {
        route_prefix_ = std::move(prefix);
    }

    [[nodiscard]] auto route_prefix() const -> const std::string& {
        return route_prefix_;
    }

    /// Joins `path` onto the route prefix. Paths starting with `/` are
    /// absolute and returned unchanged.
    [[nodiscard]] auto resolve_route_path(const std::string& path) const -> std::string;

    // ========================================================================
    // Persistence
    // ========================================================================

    void set_table(std::string table) {
        table_ = std::move(table);
    }

    [[nodiscard]] auto table() const -> const std::string& {
        return table_;
    }

    void set_source(std::string source) {
        source_ = std::move(source);
    }

    [[nodiscard]] auto source() const -> const std::string& {
        return source_;
    }

    void add_column(ColumnDef column);

    [[nodiscard]] auto columns() const -> const std::vector<ColumnDef>& {
        return columns_;
    }

    /// Column mapped to `property`, or `nullptr`.
    [[nodiscard]] auto find_column(const std::string& property) const -> const ColumnDef*;

    [[nodiscard]] auto primary_key() const -> const std::string& {
        return primary_key_;
    }

    void add_relation(RelationDef relation) {
        relations_.push_back(std::move(relation));
    }

    [[nodiscard]] auto relations() const -> const std::vector<RelationDef>& {
        return relations_;
    }

    [[nodiscard]] auto find_relation(const std::string& name) const -> const RelationDef*;

    /// Serializes the descriptor; empty bindings are omitted.
    [[nodiscard]] auto to_json() const -> json::JsonValue;

private:
    std::string class_name_;
    std::vector<RouteDef> routes_;
    std::string route_prefix_;
    std::string table_;
    std::string source_;
    std::vector<ColumnDef> columns_;
    std::string primary_key_;
    std::vector<RelationDef> relations_;
};

} // namespace notate::descriptor

#endif // NOTATE_DESCRIPTOR_CLASS_DESCRIPTOR_HPP

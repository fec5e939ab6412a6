//! # Model Annotations
//!
//! Directives read by the ORM mapper on `Model` subclasses.
//!
//! | Directive | Target | Effect |
//! |-----------|--------|--------|
//! | `!Table name` | Class | table binding |
//! | `!Source name` | Class | data-source binding |
//! | `!Column type, ...` | Property | column mapping |
//! | `!HasMany name, ...` | Class | one-to-many relation |
//! | `!BelongsTo name, ...` | Class | many-to-one relation |

#ifndef NOTATE_ANNOTATIONS_MODEL_HPP
#define NOTATE_ANNOTATIONS_MODEL_HPP

#include "annotation/annotation.hpp"

#include <optional>
#include <string>
#include <vector>

namespace notate::annotations {

/// Base class required of mapped classes.
constexpr const char* MODEL_CLASS = "Model";

/// Column types accepted by `!Column`, lower-case.
[[nodiscard]] auto column_types() -> const std::vector<std::string>&;

/// Modifiers accepted after the column type.
[[nodiscard]] auto column_modifiers() -> const std::vector<std::string>&;

/// Accepted `ondelete:` values.
[[nodiscard]] auto delete_actions() -> const std::vector<std::string>&;

/// `!Table name`
class TableAnnotation : public annotation::Annotation {
public:
    static constexpr const char* DIRECTIVE = "Table";

    [[nodiscard]] auto class_name() const -> std::string override {
        return "TableAnnotation";
    }
    [[nodiscard]] auto usage() const -> std::string override {
        return "!Table tableName";
    }
    [[nodiscard]] auto is_for() const -> annotation::ApplicabilityMask override {
        return annotation::TargetKind::Class;
    }

protected:
    void validate(const std::string& class_name,
                  const annotation::ClassHierarchy& hierarchy) override;
    void expand(const annotation::Target& target,
                descriptor::ClassDescriptor& descriptor) override;
};

/// `!Source name`
class SourceAnnotation : public annotation::Annotation {
public:
    static constexpr const char* DIRECTIVE = "Source";

    [[nodiscard]] auto class_name() const -> std::string override {
        return "SourceAnnotation";
    }
    [[nodiscard]] auto usage() const -> std::string override {
        return "!Source dataSourceName";
    }
    [[nodiscard]] auto is_for() const -> annotation::ApplicabilityMask override {
        return annotation::TargetKind::Class;
    }

protected:
    void validate(const std::string& class_name,
                  const annotation::ClassHierarchy& hierarchy) override;
    void expand(const annotation::Target& target,
                descriptor::ClassDescriptor& descriptor) override;
};

/// `!Column type[, PrimaryKey][, AutoIncrement][, nullable: bool][, default: value]`
class ColumnAnnotation : public annotation::Annotation {
public:
    static constexpr const char* DIRECTIVE = "Column";

    ColumnAnnotation();

    [[nodiscard]] auto class_name() const -> std::string override {
        return "ColumnAnnotation";
    }
    [[nodiscard]] auto usage() const -> std::string override;
    [[nodiscard]] auto is_for() const -> annotation::ApplicabilityMask override {
        return annotation::TargetKind::Property;
    }

protected:
    void validate(const std::string& class_name,
                  const annotation::ClassHierarchy& hierarchy) override;
    void expand(const annotation::Target& target,
                descriptor::ClassDescriptor& descriptor) override;

private:
    bool nullable_ = true;
    std::optional<std::string> default_;
};

/// Shared keys and checks for relation directives.
class RelationAnnotation : public annotation::Annotation {
protected:
    RelationAnnotation();

    /// Checks common to all relation kinds; `keys` are the accepted keys.
    void validate_relation(const std::string& class_name,
                           const annotation::ClassHierarchy& hierarchy,
                           const std::vector<std::string>& keys);

    /// Relation fields shared by every kind, with explicit keys applied.
    [[nodiscard]] auto base_relation(descriptor::RelationKind kind) const
        -> descriptor::RelationDef;

    std::string class_;
    std::string key_;
    std::string on_delete_;
};

/// `!HasMany name[, class: Class][, key: foreignKey][, through: Join][, ondelete: Action]`
class HasManyAnnotation : public RelationAnnotation {
public:
    static constexpr const char* DIRECTIVE = "HasMany";

    HasManyAnnotation();

    [[nodiscard]] auto class_name() const -> std::string override {
        return "HasManyAnnotation";
    }
    [[nodiscard]] auto usage() const -> std::string override;
    [[nodiscard]] auto is_for() const -> annotation::ApplicabilityMask override {
        return annotation::TargetKind::Class;
    }

protected:
    void validate(const std::string& class_name,
                  const annotation::ClassHierarchy& hierarchy) override;
    void expand(const annotation::Target& target,
                descriptor::ClassDescriptor& descriptor) override;

private:
    std::string through_;
};

/// `!BelongsTo name[, class: Class][, key: foreignKey][, ondelete: Action]`
class BelongsToAnnotation : public RelationAnnotation {
public:
    static constexpr const char* DIRECTIVE = "BelongsTo";

    [[nodiscard]] auto class_name() const -> std::string override {
        return "BelongsToAnnotation";
    }
    [[nodiscard]] auto usage() const -> std::string override;
    [[nodiscard]] auto is_for() const -> annotation::ApplicabilityMask override {
        return annotation::TargetKind::Class;
    }

protected:
    void validate(const std::string& class_name,
                  const annotation::ClassHierarchy& hierarchy) override;
    void expand(const annotation::Target& target,
                descriptor::ClassDescriptor& descriptor) override;
};

/// "posts" -> "Post": trailing `s` dropped, first letter upper-cased.
[[nodiscard]] auto default_related_class(const std::string& relation, bool plural)
    -> std::string;

/// First letter lower-cased: "User" -> "user".
[[nodiscard]] auto lcfirst(std::string s) -> std::string;

/// First letter upper-cased: "user" -> "User".
[[nodiscard]] auto ucfirst(std::string s) -> std::string;

} // namespace notate::annotations

#endif // NOTATE_ANNOTATIONS_MODEL_HPP

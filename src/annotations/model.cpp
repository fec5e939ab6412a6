#include "annotations/model.hpp"

#include <algorithm>
#include <cctype>

namespace notate::annotations {

using annotation::CaseNormalization;
using annotation::ClassHierarchy;
using annotation::Target;

auto column_types() -> const std::vector<std::string>& {
    static const std::vector<std::string> types = {"string", "text",     "integer",  "decimal",
                                                   "float",  "time",     "timestamp", "date",
                                                   "datetime", "blob",   "boolean"};
    return types;
}

auto column_modifiers() -> const std::vector<std::string>& {
    static const std::vector<std::string> modifiers = {"PrimaryKey", "AutoIncrement"};
    return modifiers;
}

auto delete_actions() -> const std::vector<std::string>& {
    static const std::vector<std::string> actions = {"Cascade", "Delete", "Nullify"};
    return actions;
}

namespace {

auto contains(const std::vector<std::string>& set, const std::string& value) -> bool {
    return std::find(set.begin(), set.end(), value) != set.end();
}

auto keyed_count(const annotation::Annotation& annotation) -> size_t {
    const auto* params = annotation.parameters();
    return params ? params->keyed().size() : 0;
}

} // namespace

// ============================================================================
// TableAnnotation / SourceAnnotation
// ============================================================================

void TableAnnotation::validate(const std::string& class_name, const ClassHierarchy& hierarchy) {
    valid_on_subclasses_of(hierarchy, class_name, MODEL_CLASS);
    accepts_no_keyed_values();
    exact_parameter_count(1);
}

void TableAnnotation::expand(const Target& /*target*/, descriptor::ClassDescriptor& descriptor) {
    descriptor.set_table(values()[0].to_string());
}

void SourceAnnotation::validate(const std::string& class_name, const ClassHierarchy& hierarchy) {
    valid_on_subclasses_of(hierarchy, class_name, MODEL_CLASS);
    accepts_no_keyed_values();
    exact_parameter_count(1);
}

void SourceAnnotation::expand(const Target& /*target*/, descriptor::ClassDescriptor& descriptor) {
    descriptor.set_source(values()[0].to_string());
}

// ============================================================================
// ColumnAnnotation
// ============================================================================

ColumnAnnotation::ColumnAnnotation() {
    bind_key("nullable", nullable_);
    bind_key("default", default_);
}

auto ColumnAnnotation::usage() const -> std::string {
    return "!Column type[, PrimaryKey][, AutoIncrement][, nullable: true|false][, default: "
           "value]\n"
           "type is one of " +
           annotation::join_values(column_types()) + ".";
}

void ColumnAnnotation::validate(const std::string& class_name, const ClassHierarchy& hierarchy) {
    valid_on_subclasses_of(hierarchy, class_name, MODEL_CLASS);
    minimum_parameter_count(1);
    accepted_keys({"nullable", "default"});
    accepted_values_for_key("nullable", {"true", "false"}, CaseNormalization::Lower);

    const auto* params = parameters();
    if (params == nullptr) {
        return;
    }

    const annotation::Value* type = params->at(0);
    if (type == nullptr ||
        !contains(column_types(), annotation::to_lower(type->to_string()))) {
        accepted_indexed_values(0, column_types());
    }

    const auto& positional = params->positional();
    for (size_t i = 1; i < positional.size(); ++i) {
        auto text = positional[i].to_string();
        if (!contains(column_modifiers(), text)) {
            add_error("Unknown parameter: \"" + text + "\".");
        }
    }
}

void ColumnAnnotation::expand(const Target& target, descriptor::ClassDescriptor& descriptor) {
    descriptor::ColumnDef column;
    column.property = target.element_name;
    column.type = annotation::to_lower(values()[0].to_string());
    column.primary_key = is_a_value("PrimaryKey");
    column.auto_increment = is_a_value("AutoIncrement");
    column.nullable = nullable_ && !column.primary_key;
    column.default_value = default_;
    descriptor.add_column(std::move(column));
}

// ============================================================================
// Relations
// ============================================================================

auto lcfirst(std::string s) -> std::string {
    if (!s.empty()) {
        s[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(s[0])));
    }
    return s;
}

auto ucfirst(std::string s) -> std::string {
    if (!s.empty()) {
        s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    }
    return s;
}

auto default_related_class(const std::string& relation, bool plural) -> std::string {
    std::string name = relation;
    if (plural && name.size() > 1 && name.back() == 's') {
        name.pop_back();
    }
    return ucfirst(std::move(name));
}

RelationAnnotation::RelationAnnotation() {
    bind_key("class", class_);
    bind_key("key", key_);
    bind_key("ondelete", on_delete_);
}

void RelationAnnotation::validate_relation(const std::string& class_name,
                                           const ClassHierarchy& hierarchy,
                                           const std::vector<std::string>& keys) {
    valid_on_subclasses_of(hierarchy, class_name, MODEL_CLASS);
    accepted_keys(keys);
    exact_parameter_count(1 + keyed_count(*this));
    accepted_values_for_key("ondelete", delete_actions());
}

auto RelationAnnotation::base_relation(descriptor::RelationKind kind) const
    -> descriptor::RelationDef {
    descriptor::RelationDef relation;
    relation.kind = kind;
    relation.name = values()[0].to_string();
    relation.related_class = class_;
    relation.foreign_key = key_;
    if (auto action = descriptor::parse_delete_action(on_delete_)) {
        relation.on_delete = *action;
    }
    return relation;
}

HasManyAnnotation::HasManyAnnotation() {
    bind_key("through", through_);
}

auto HasManyAnnotation::usage() const -> std::string {
    return "!HasMany relationName[, class: RelatedClass][, key: foreignKey][, through: "
           "JoinClass][, ondelete: Cascade|Delete|Nullify]";
}

void HasManyAnnotation::validate(const std::string& class_name, const ClassHierarchy& hierarchy) {
    validate_relation(class_name, hierarchy, {"class", "key", "through", "ondelete"});
}

void HasManyAnnotation::expand(const Target& target, descriptor::ClassDescriptor& descriptor) {
    auto relation = base_relation(descriptor::RelationKind::HasMany);
    if (relation.related_class.empty()) {
        relation.related_class = default_related_class(relation.name, true);
    }
    if (relation.foreign_key.empty()) {
        relation.foreign_key = lcfirst(target.class_name) + "Id";
    }
    relation.through = through_;
    descriptor.add_relation(std::move(relation));
}

auto BelongsToAnnotation::usage() const -> std::string {
    return "!BelongsTo relationName[, class: RelatedClass][, key: foreignKey][, ondelete: "
           "Cascade|Delete|Nullify]";
}

void BelongsToAnnotation::validate(const std::string& class_name,
                                   const ClassHierarchy& hierarchy) {
    validate_relation(class_name, hierarchy, {"class", "key", "ondelete"});
}

void BelongsToAnnotation::expand(const Target& /*target*/,
                                 descriptor::ClassDescriptor& descriptor) {
    auto relation = base_relation(descriptor::RelationKind::BelongsTo);
    if (relation.related_class.empty()) {
        relation.related_class = default_related_class(relation.name, false);
    }
    if (relation.foreign_key.empty()) {
        relation.foreign_key = relation.name + "Id";
    }
    descriptor.add_relation(std::move(relation));
}

} // namespace notate::annotations

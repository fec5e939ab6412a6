//! # Expansion Driver
//!
//! Runs every directive found in a class's comments against one descriptor.
//!
//! Elements are visited in source order: the class comment first, then its
//! properties, then its methods. Within a comment, directives run in the
//! order they are written. A directive that fails (unparseable arguments,
//! unknown kind, invalid usage) is recorded in the report and skipped; its
//! siblings still run.

#ifndef NOTATE_ANNOTATION_EXPANDER_HPP
#define NOTATE_ANNOTATION_EXPANDER_HPP

#include "annotation/error.hpp"
#include "annotation/registry.hpp"
#include "annotation/target.hpp"
#include "descriptor/class_descriptor.hpp"

#include <string>
#include <vector>

namespace notate::annotation {

/// A commented element ready for expansion.
struct Element {
    Target target;
    std::string comment;
};

/// A method or property as described by the reflection layer.
struct MemberSource {
    std::string name;
    int line = 0;
    std::string comment;
};

/// A class and its commented members.
struct ClassSource {
    std::string name;
    std::string file;
    int line = 0;
    std::string comment;
    std::vector<MemberSource> properties;
    std::vector<MemberSource> methods;

    /// Elements in expansion order.
    [[nodiscard]] auto elements() const -> std::vector<Element>;
};

/// Outcome of expanding one element or class.
struct ExpansionReport {
    std::vector<AnnotationError> errors;
    size_t expanded = 0; ///< Directives that reached `Expanded`.

    [[nodiscard]] auto ok() const -> bool {
        return errors.empty();
    }

    void merge(ExpansionReport other);
};

class Expander {
public:
    Expander(const AnnotationRegistry& registry, const ClassHierarchy& hierarchy)
        : registry_(registry), hierarchy_(hierarchy) {}

    /// Expands every directive in `element.comment` into `descriptor`.
    auto expand_element(const Element& element, descriptor::ClassDescriptor& descriptor) const
        -> ExpansionReport;

    /// Expands the class comment, then properties, then methods.
    auto expand_class(const ClassSource& source, descriptor::ClassDescriptor& descriptor) const
        -> ExpansionReport;

private:
    const AnnotationRegistry& registry_;
    const ClassHierarchy& hierarchy_;
};

} // namespace notate::annotation

#endif // NOTATE_ANNOTATION_EXPANDER_HPP

//! # Annotation Base
//!
//! Abstract base for every annotation kind. A concrete kind declares where it
//! applies (`is_for`), how it is written (`usage`), what parameters it
//! accepts (`validate`, using the protected validation primitives) and what
//! it does to the descriptor (`expand`).
//!
//! ## Lifecycle
//!
//! ```text
//! Parsed ─► TypeChecked ─► Validated ─► Bound ─► Expanded
//!    │           │              │
//!    └───────────┴──────────────┴──► Failed
//! ```
//!
//! - **TypeChecked**: the target kind is tested against `is_for()`
//! - **Validated**: `validate()` runs even after a type error so that every
//!   problem is reported at once
//! - **Bound**: keyed parameters go through the setters registered with
//!   `bind_key`; positional parameters are appended to `values()`
//! - **Expanded**: `expand()` has mutated the descriptor
//!
//! An instance with errors never reaches `expand()`.
//!
//! ## Example
//!
//! ```cpp
//! class TableAnnotation : public Annotation {
//!     // ...
//!     void validate(const std::string& cls, const ClassHierarchy& h) override {
//!         exact_parameter_count(1);
//!         valid_on_subclasses_of(h, cls, "Model");
//!     }
//!     void expand(const Target&, descriptor::ClassDescriptor& d) override {
//!         d.set_table(values()[0].to_string());
//!     }
//! };
//! ```

#ifndef NOTATE_ANNOTATION_ANNOTATION_HPP
#define NOTATE_ANNOTATION_ANNOTATION_HPP

#include "annotation/error.hpp"
#include "annotation/target.hpp"
#include "annotation/value.hpp"
#include "common.hpp"
#include "descriptor/class_descriptor.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace notate::annotation {

/// Progress of one annotation instance through expansion.
enum class AnnotationState { Parsed, TypeChecked, Validated, Bound, Expanded, Failed };

[[nodiscard]] auto state_name(AnnotationState state) -> const char*;

/// Normalization applied to a value before a set-membership check.
enum class CaseNormalization { None, Lower, Upper };

/// Receives one keyed parameter during binding.
using KeySetter = std::function<void(const Value&)>;

class Annotation {
public:
    Annotation() = default;
    virtual ~Annotation() = default;

    Annotation(const Annotation&) = delete;
    auto operator=(const Annotation&) -> Annotation& = delete;

    /// Canonical name, e.g. "RouteAnnotation".
    [[nodiscard]] virtual auto class_name() const -> std::string = 0;

    /// Human-readable usage shown in diagnostics.
    [[nodiscard]] virtual auto usage() const -> std::string = 0;

    /// Target kinds this annotation may be attached to.
    [[nodiscard]] virtual auto is_for() const -> ApplicabilityMask = 0;

    /// Supplies the evaluated parameters. Resets errors and state.
    void init(ParameterList parameters);

    /// Runs the full type-check, validate, bind and expand sequence.
    ///
    /// # Returns
    ///
    /// The same `descriptor` on success, or one `Invalid` error carrying
    /// every message collected for this instance.
    auto expand_annotation(const Target& target, descriptor::ClassDescriptor& descriptor,
                           const ClassHierarchy& hierarchy)
        -> Result<descriptor::ClassDescriptor*, AnnotationError>;

    [[nodiscard]] auto state() const -> AnnotationState {
        return state_;
    }

    [[nodiscard]] auto errors() const -> const std::vector<std::string>& {
        return errors_;
    }

    /// Pending parameters; `nullptr` once bound.
    [[nodiscard]] auto parameters() const -> const ParameterList* {
        return parameters_ ? &*parameters_ : nullptr;
    }

    /// Positional values, populated at binding.
    [[nodiscard]] auto values() const -> const ValueList& {
        return values_;
    }

    /// True if `value` appears among the parameters or bound values.
    [[nodiscard]] auto is_a_value(const std::string& value) const -> bool;

    /// First parameter or bound value not in `allowed`, if any.
    [[nodiscard]] auto value_not_in(const std::vector<std::string>& allowed) const
        -> std::optional<Value>;

protected:
    /// Kind-specific checks. Runs before binding, so reads `parameters()`.
    virtual void validate(const std::string& class_name, const ClassHierarchy& hierarchy) = 0;

    /// Kind-specific effect on the descriptor. Runs after binding.
    virtual void expand(const Target& target, descriptor::ClassDescriptor& descriptor) = 0;

    // ========================================================================
    // Key Binding
    // ========================================================================

    /// Registers the setter for a keyed parameter. Keys are case-insensitive.
    void bind_key(const std::string& key, KeySetter setter);

    /// Binds a key to a string field (display form of the value).
    void bind_key(const std::string& key, std::string& field);

    /// Binds a key to a flag field (`Value::truthy`).
    void bind_key(const std::string& key, bool& field);

    /// Binds a key to an optional string field.
    void bind_key(const std::string& key, std::optional<std::string>& field);

    [[nodiscard]] auto is_bound_key(const std::string& key) const -> bool;

    // ========================================================================
    // Validation Primitives
    // ========================================================================

    /// Records an error message; identical messages are recorded once.
    void add_error(std::string message);

    void required_keys(const std::vector<std::string>& keys);
    void accepted_keys(const std::vector<std::string>& keys);
    void accepted_keyless_values(const std::vector<std::string>& values);
    void accepted_indexed_values(size_t index, const std::vector<std::string>& values);
    void accepted_values_for_key(const std::string& key, const std::vector<std::string>& values,
                                 CaseNormalization normalization = CaseNormalization::None);

    void accepts_no_keyless_values() {
        accepted_keyless_values({});
    }

    void accepts_no_keyed_values() {
        accepted_keys({});
    }

    void valid_on_subclasses_of(const ClassHierarchy& hierarchy, const std::string& class_name,
                                const std::string& base);

    void minimum_parameter_count(size_t count);
    void maximum_parameter_count(size_t count);
    void exact_parameter_count(size_t count);

private:
    std::optional<ParameterList> parameters_ = ParameterList();
    ValueList values_;
    std::vector<std::string> errors_;
    std::vector<std::pair<std::string, KeySetter>> bindings_;
    AnnotationState state_ = AnnotationState::Parsed;

    [[nodiscard]] auto pending() const -> const ParameterList&;
    [[nodiscard]] auto find_setter(const std::string& key) const -> const KeySetter*;
    [[nodiscard]] auto compose_diagnostic(const Target& target, bool type_error) const
        -> std::string;
    void bind();
};

/// Joins `values` with ", ".
[[nodiscard]] auto join_values(const std::vector<std::string>& values) -> std::string;

} // namespace notate::annotation

#endif // NOTATE_ANNOTATION_ANNOTATION_HPP

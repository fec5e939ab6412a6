//! # Annotation Targets
//!
//! The program element an annotation is attached to, as supplied by the
//! reflection collaborator, and the class hierarchy used for
//! `valid_on_subclasses_of` checks.
//!
//! Target kinds are never inferred here: the caller states whether a comment
//! belongs to a class, a method or a property.

#ifndef NOTATE_ANNOTATION_TARGET_HPP
#define NOTATE_ANNOTATION_TARGET_HPP

#include <cstdint>
#include <string>
#include <unordered_map>

namespace notate::annotation {

/// Kind of program element. Values are bit flags for `ApplicabilityMask`.
enum class TargetKind : uint8_t { Class = 1, Method = 2, Property = 4 };

/// Set of target kinds an annotation kind may be attached to.
class ApplicabilityMask {
public:
    constexpr ApplicabilityMask() = default;
    constexpr ApplicabilityMask(TargetKind kind) : bits_(static_cast<uint8_t>(kind)) {}

    [[nodiscard]] constexpr auto contains(TargetKind kind) const -> bool {
        return (bits_ & static_cast<uint8_t>(kind)) != 0;
    }

    [[nodiscard]] constexpr auto empty() const -> bool {
        return bits_ == 0;
    }

    [[nodiscard]] constexpr auto bits() const -> uint8_t {
        return bits_;
    }

    constexpr auto operator|(ApplicabilityMask other) const -> ApplicabilityMask {
        ApplicabilityMask mask;
        mask.bits_ = static_cast<uint8_t>(bits_ | other.bits_);
        return mask;
    }

    /// Plural display names in Class, Method, Property order: "Classes, Methods".
    [[nodiscard]] auto describe() const -> std::string;

private:
    uint8_t bits_ = 0;
};

constexpr auto operator|(TargetKind a, TargetKind b) -> ApplicabilityMask {
    return ApplicabilityMask(a) | ApplicabilityMask(b);
}

/// Singular display name: "class", "method", "property".
[[nodiscard]] auto target_kind_name(TargetKind kind) -> const char*;

/// A concrete element carrying a comment.
struct Target {
    TargetKind kind = TargetKind::Class;
    std::string class_name;   ///< Owning class (the class itself for class targets).
    std::string element_name; ///< Method or property name; class name for classes.
    std::string file;
    int line = 0;

    /// `method "index"`, `property "id" of class "User"`, `class "User"`.
    [[nodiscard]] auto describe() const -> std::string;
};

// ============================================================================
// Class Hierarchy
// ============================================================================

/// Answers subclass queries on behalf of the reflection layer.
class ClassHierarchy {
public:
    virtual ~ClassHierarchy() = default;

    /// True if `class_name` derives from `base` directly or transitively.
    /// A class is not a subclass of itself.
    [[nodiscard]] virtual auto is_subclass_of(const std::string& class_name,
                                              const std::string& base) const -> bool = 0;
};

/// In-memory hierarchy built from `class -> parent` declarations.
class StaticClassHierarchy : public ClassHierarchy {
public:
    /// Declares `parent` as the direct superclass of `class_name`.
    void declare(const std::string& class_name, const std::string& parent);

    [[nodiscard]] auto parent_of(const std::string& class_name) const -> const std::string*;

    [[nodiscard]] auto is_subclass_of(const std::string& class_name,
                                      const std::string& base) const -> bool override;

    [[nodiscard]] auto size() const -> size_t {
        return parents_.size();
    }

private:
    std::unordered_map<std::string, std::string> parents_;
};

} // namespace notate::annotation

#endif // NOTATE_ANNOTATION_TARGET_HPP

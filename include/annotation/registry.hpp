//! # Annotation Registry
//!
//! Maps directive names to annotation factories. A registry is populated
//! during startup, then sealed; after `seal()` it is read-only and may be
//! shared between threads expanding different classes.
//!
//! Kinds are stored under their canonical name, the directive name plus the
//! `Annotation` suffix: `!Route` resolves to `RouteAnnotation`.
//!
//! ## Example
//!
//! ```cpp
//! AnnotationRegistry registry;
//! registry.add<RouteAnnotation>();
//! registry.seal();
//!
//! auto result = registry.lookup("Route");
//! ```

#ifndef NOTATE_ANNOTATION_REGISTRY_HPP
#define NOTATE_ANNOTATION_REGISTRY_HPP

#include "annotation/annotation.hpp"
#include "annotation/directive.hpp"
#include "annotation/error.hpp"
#include "annotation/target.hpp"
#include "common.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace notate::annotation {

/// Suffix appended to directive names to form canonical kind names.
constexpr const char* ANNOTATION_SUFFIX = "Annotation";

/// Creates a fresh, uninitialized annotation instance.
using AnnotationFactory = std::function<Box<Annotation>()>;

class AnnotationRegistry {
public:
    AnnotationRegistry() = default;

    /// Registers `T` under `T::DIRECTIVE`.
    template <typename T> auto add() -> bool {
        return add(T::DIRECTIVE, [] { return Box<Annotation>(make_box<T>()); });
    }

    /// Registers a factory for directive `name`. Re-registering a name
    /// replaces the earlier factory. Fails once the registry is sealed, and
    /// for a factory whose kind applies to no target.
    auto add(const std::string& name, AnnotationFactory factory) -> bool;

    /// Ends registration.
    void seal() {
        sealed_ = true;
    }

    [[nodiscard]] auto sealed() const -> bool {
        return sealed_;
    }

    /// Creates a fresh instance for directive `name`.
    ///
    /// # Returns
    ///
    /// An `UnknownAnnotation` error if nothing is registered under `name`.
    [[nodiscard]] auto lookup(const std::string& name) const
        -> Result<Box<Annotation>, AnnotationError>;

    /// Evaluates the invocation's arguments, looks up its kind and
    /// initializes a new instance with the parameters.
    ///
    /// `target` only supplies the file and line for diagnostics.
    [[nodiscard]] auto instantiate(const RawInvocation& invocation, const Target& target) const
        -> Result<Box<Annotation>, AnnotationError>;

    [[nodiscard]] auto contains(const std::string& name) const -> bool;

    [[nodiscard]] auto size() const -> size_t {
        return factories_.size();
    }

    /// Canonical names, sorted.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    /// A sealed registry holding every built-in kind.
    [[nodiscard]] static auto with_builtins() -> AnnotationRegistry;

private:
    std::map<std::string, AnnotationFactory> factories_;
    bool sealed_ = false;
};

} // namespace notate::annotation

#endif // NOTATE_ANNOTATION_REGISTRY_HPP

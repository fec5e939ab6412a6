#include "annotation/registry.hpp"

#include "annotation/evaluator.hpp"
#include "annotations/builtins.hpp"
#include "log/log.hpp"

namespace notate::annotation {

auto AnnotationRegistry::add(const std::string& name, AnnotationFactory factory) -> bool {
    if (sealed_) {
        NOTATE_LOG_ERROR("registry", "Cannot register " << name << ANNOTATION_SUFFIX
                                                        << ": registry is sealed");
        return false;
    }
    auto canonical = name + ANNOTATION_SUFFIX;

    // Every kind must apply to at least one target kind
    Box<Annotation> sample = factory ? factory() : nullptr;
    if (!sample) {
        NOTATE_LOG_ERROR("registry", "Cannot register " << canonical << ": factory made no instance");
        return false;
    }
    if (sample->is_for().empty()) {
        NOTATE_LOG_ERROR("registry",
                         "Cannot register " << canonical << ": it applies to no target kind");
        return false;
    }

    if (factories_.count(canonical) > 0) {
        NOTATE_LOG_DEBUG("registry", "Replacing " << canonical);
    }
    factories_[canonical] = std::move(factory);
    NOTATE_LOG_TRACE("registry", "Registered " << canonical);
    return true;
}

auto AnnotationRegistry::contains(const std::string& name) const -> bool {
    return factories_.count(name + ANNOTATION_SUFFIX) > 0;
}

auto AnnotationRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        out.push_back(name);
    }
    return out;
}

auto AnnotationRegistry::lookup(const std::string& name) const
    -> Result<Box<Annotation>, AnnotationError> {
    auto canonical = name + ANNOTATION_SUFFIX;
    auto it = factories_.find(canonical);
    if (it == factories_.end()) {
        AnnotationError error;
        error.kind = AnnotationErrorKind::UnknownAnnotation;
        error.annotation = canonical;
        error.message = "Unknown annotation: \"" + name + "\". It must be registered as \"" +
                        canonical + "\" before use.";
        return error;
    }
    return it->second();
}

auto AnnotationRegistry::instantiate(const RawInvocation& invocation, const Target& target) const
    -> Result<Box<Annotation>, AnnotationError> {
    auto evaluated = evaluate_arguments(invocation.argument_text);
    if (is_err(evaluated)) {
        AnnotationError error;
        error.kind = AnnotationErrorKind::Parse;
        error.annotation = invocation.name + ANNOTATION_SUFFIX;
        error.message = "There is an unparseable annotation value: \"!" + invocation.name + " " +
                        invocation.argument_text + "\" (" + unwrap_err(evaluated).message + ")";
        error.file = target.file;
        error.line = target.line;
        return error;
    }

    auto found = lookup(invocation.name);
    if (is_err(found)) {
        auto& error = unwrap_err(found);
        error.file = target.file;
        error.line = target.line;
        return std::move(error);
    }

    auto instance = std::move(unwrap(found));
    instance->init(std::move(unwrap(evaluated)));
    return instance;
}

auto AnnotationRegistry::with_builtins() -> AnnotationRegistry {
    AnnotationRegistry registry;
    annotations::register_builtin_annotations(registry);
    registry.seal();
    return registry;
}

} // namespace notate::annotation

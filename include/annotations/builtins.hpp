//! # Built-in Annotations
//!
//! Registration entry point for the annotation kinds shipped with notate.

#ifndef NOTATE_ANNOTATIONS_BUILTINS_HPP
#define NOTATE_ANNOTATIONS_BUILTINS_HPP

namespace notate::annotation {
class AnnotationRegistry;
}

namespace notate::annotations {

/// Adds Route, Prefix, Table, Source, Column, HasMany and BelongsTo to
/// `registry`. Does not seal it.
void register_builtin_annotations(annotation::AnnotationRegistry& registry);

} // namespace notate::annotations

#endif // NOTATE_ANNOTATIONS_BUILTINS_HPP

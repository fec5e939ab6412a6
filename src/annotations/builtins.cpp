#include "annotations/builtins.hpp"

#include "annotation/registry.hpp"
#include "annotations/model.hpp"
#include "annotations/routing.hpp"

namespace notate::annotations {

void register_builtin_annotations(annotation::AnnotationRegistry& registry) {
    registry.add<RouteAnnotation>();
    registry.add<PrefixAnnotation>();
    registry.add<TableAnnotation>();
    registry.add<SourceAnnotation>();
    registry.add<ColumnAnnotation>();
    registry.add<HasManyAnnotation>();
    registry.add<BelongsToAnnotation>();
}

} // namespace notate::annotations

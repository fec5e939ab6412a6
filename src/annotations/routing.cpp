#include "annotations/routing.hpp"

#include <algorithm>

namespace notate::annotations {

using annotation::ClassHierarchy;
using annotation::Target;

auto route_methods() -> const std::vector<std::string>& {
    static const std::vector<std::string> methods = {"GET", "POST", "PUT", "DELETE"};
    return methods;
}

// ============================================================================
// RouteAnnotation
// ============================================================================

RouteAnnotation::RouteAnnotation() {
    bind_key("name", name_);
}

auto RouteAnnotation::usage() const -> std::string {
    return "!Route METHOD, path[, name: routeName]\n"
           "METHOD is one of GET, POST, PUT, DELETE; a relative path is joined to the "
           "controller's !Prefix.";
}

void RouteAnnotation::validate(const std::string& class_name, const ClassHierarchy& hierarchy) {
    valid_on_subclasses_of(hierarchy, class_name, CONTROLLER_CLASS);
    accepted_keys({"name"});

    const auto* params = parameters();
    size_t keyed = params ? params->keyed().size() : 0;
    exact_parameter_count(2 + keyed);

    // The method is matched case-insensitively and stored upper-case
    const annotation::Value* method = params ? params->at(0) : nullptr;
    const auto& methods = route_methods();
    if (method == nullptr || std::find(methods.begin(), methods.end(),
                                       annotation::to_upper(method->to_string())) ==
                                 methods.end()) {
        accepted_indexed_values(0, methods);
    }
}

void RouteAnnotation::expand(const Target& target, descriptor::ClassDescriptor& descriptor) {
    descriptor::RouteDef route;
    route.method = annotation::to_upper(values()[0].to_string());
    route.path = descriptor.resolve_route_path(values()[1].to_string());
    route.handler = target.element_name;
    route.name = name_;
    descriptor.add_route(std::move(route));
}

// ============================================================================
// PrefixAnnotation
// ============================================================================

auto PrefixAnnotation::usage() const -> std::string {
    return "!Prefix path\nSets the path prefix for every !Route in the controller.";
}

void PrefixAnnotation::validate(const std::string& class_name, const ClassHierarchy& hierarchy) {
    valid_on_subclasses_of(hierarchy, class_name, CONTROLLER_CLASS);
    accepts_no_keyed_values();
    exact_parameter_count(1);
}

void PrefixAnnotation::expand(const Target& /*target*/, descriptor::ClassDescriptor& descriptor) {
    auto prefix = values()[0].to_string();
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += '/';
    }
    descriptor.set_route_prefix(std::move(prefix));
}

} // namespace notate::annotations

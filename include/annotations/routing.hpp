//! # Routing Annotations
//!
//! Directives read by the router: `!Route` on controller methods and
//! `!Prefix` on controller classes.
//!
//! ```text
//! /** !Prefix users/ */
//! class UsersController extends Controller {
//!     /** !Route GET, ':id', name: users.show */
//!     function show($id) { ... }
//! }
//! ```
//!
//! yields the route `GET users/:id -> show`.

#ifndef NOTATE_ANNOTATIONS_ROUTING_HPP
#define NOTATE_ANNOTATIONS_ROUTING_HPP

#include "annotation/annotation.hpp"

#include <string>
#include <vector>

namespace notate::annotations {

/// Base class required of routed classes.
constexpr const char* CONTROLLER_CLASS = "Controller";

/// HTTP methods accepted by `!Route`, upper-case.
[[nodiscard]] auto route_methods() -> const std::vector<std::string>&;

/// `!Route METHOD, path[, name: routeName]`
class RouteAnnotation : public annotation::Annotation {
public:
    static constexpr const char* DIRECTIVE = "Route";

    RouteAnnotation();

    [[nodiscard]] auto class_name() const -> std::string override {
        return "RouteAnnotation";
    }
    [[nodiscard]] auto usage() const -> std::string override;
    [[nodiscard]] auto is_for() const -> annotation::ApplicabilityMask override {
        return annotation::TargetKind::Method;
    }

protected:
    void validate(const std::string& class_name,
                  const annotation::ClassHierarchy& hierarchy) override;
    void expand(const annotation::Target& target,
                descriptor::ClassDescriptor& descriptor) override;

private:
    std::string name_;
};

/// `!Prefix path`
class PrefixAnnotation : public annotation::Annotation {
public:
    static constexpr const char* DIRECTIVE = "Prefix";

    [[nodiscard]] auto class_name() const -> std::string override {
        return "PrefixAnnotation";
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

} // namespace notate::annotations

#endif // NOTATE_ANNOTATIONS_ROUTING_HPP

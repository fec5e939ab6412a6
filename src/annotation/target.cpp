#include "annotation/target.hpp"

namespace notate::annotation {

auto target_kind_name(TargetKind kind) -> const char* {
    switch (kind) {
    case TargetKind::Class:
        return "class";
    case TargetKind::Method:
        return "method";
    case TargetKind::Property:
        return "property";
    }
    return "element";
}

auto ApplicabilityMask::describe() const -> std::string {
    std::string out;
    auto append = [&](TargetKind kind, const char* name) {
        if (!contains(kind)) {
            return;
        }
        if (!out.empty()) {
            out += ", ";
        }
        out += name;
    };
    append(TargetKind::Class, "Classes");
    append(TargetKind::Method, "Methods");
    append(TargetKind::Property, "Properties");
    return out;
}

auto Target::describe() const -> std::string {
    switch (kind) {
    case TargetKind::Property:
        return "property \"" + element_name + "\" of class \"" + class_name + "\"";
    case TargetKind::Method:
        return "method \"" + element_name + "\"";
    case TargetKind::Class:
        return "class \"" + (element_name.empty() ? class_name : element_name) + "\"";
    }
    return "\"" + element_name + "\"";
}

void StaticClassHierarchy::declare(const std::string& class_name, const std::string& parent) {
    parents_[class_name] = parent;
}

auto StaticClassHierarchy::parent_of(const std::string& class_name) const -> const std::string* {
    auto it = parents_.find(class_name);
    return it != parents_.end() ? &it->second : nullptr;
}

auto StaticClassHierarchy::is_subclass_of(const std::string& class_name,
                                          const std::string& base) const -> bool {
    const std::string* current = parent_of(class_name);
    // Bounded walk so a cyclic declaration cannot loop forever
    for (size_t steps = 0; current != nullptr && steps <= parents_.size(); ++steps) {
        if (*current == base) {
            return true;
        }
        current = parent_of(*current);
    }
    return false;
}

} // namespace notate::annotation

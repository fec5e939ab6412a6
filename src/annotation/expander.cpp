#include "annotation/expander.hpp"

#include "annotation/directive.hpp"
#include "log/log.hpp"

namespace notate::annotation {

auto ClassSource::elements() const -> std::vector<Element> {
    std::vector<Element> out;
    out.reserve(1 + properties.size() + methods.size());

    Element cls;
    cls.target = Target{TargetKind::Class, name, name, file, line};
    cls.comment = comment;
    out.push_back(std::move(cls));

    auto add_members = [&](const std::vector<MemberSource>& members, TargetKind kind) {
        for (const auto& member : members) {
            Element element;
            element.target = Target{kind, name, member.name, file, member.line};
            element.comment = member.comment;
            out.push_back(std::move(element));
        }
    };
    add_members(properties, TargetKind::Property);
    add_members(methods, TargetKind::Method);
    return out;
}

void ExpansionReport::merge(ExpansionReport other) {
    for (auto& error : other.errors) {
        errors.push_back(std::move(error));
    }
    expanded += other.expanded;
}

auto Expander::expand_element(const Element& element,
                              descriptor::ClassDescriptor& descriptor) const -> ExpansionReport {
    ExpansionReport report;

    auto directives = extract_directives(element.comment);
    if (directives.empty()) {
        return report;
    }

    NOTATE_LOG_DEBUG("expand", "Expanding " << directives.size() << " directive(s) on "
                                            << element.target.describe());

    for (const auto& invocation : directives) {
        auto instance = registry_.instantiate(invocation, element.target);
        if (is_err(instance)) {
            NOTATE_LOG_WARN("expand", unwrap_err(instance).to_string());
            report.errors.push_back(std::move(unwrap_err(instance)));
            continue;
        }

        auto& annotation = unwrap(instance);
        auto result = annotation->expand_annotation(element.target, descriptor, hierarchy_);
        if (is_err(result)) {
            report.errors.push_back(std::move(unwrap_err(result)));
            continue;
        }
        ++report.expanded;
    }
    return report;
}

auto Expander::expand_class(const ClassSource& source,
                            descriptor::ClassDescriptor& descriptor) const -> ExpansionReport {
    ExpansionReport report;
    for (const auto& element : source.elements()) {
        report.merge(expand_element(element, descriptor));
    }

    NOTATE_LOG_INFO("expand", "Class " << source.name << ": " << report.expanded
                                       << " directive(s) expanded, " << report.errors.size()
                                       << " error(s)");
    return report;
}

} // namespace notate::annotation

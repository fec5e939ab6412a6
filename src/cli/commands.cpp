#include "cli/commands.hpp"

#include "annotation/directive.hpp"
#include "annotation/evaluator.hpp"
#include "annotation/expander.hpp"
#include "cli/utils.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <iostream>
#include <sstream>

namespace notate::cli {

namespace {

auto render_json(const json::JsonValue& value) -> std::string {
    return NotateOptions::pretty_output ? value.to_string_pretty() : value.to_string();
}

} // namespace

// ============================================================================
// expand
// ============================================================================

int expand_manifest_to(const Manifest& manifest, const annotation::AnnotationRegistry& registry,
                       std::ostream& out, std::ostream& err) {
    annotation::Expander expander(registry, manifest.hierarchy);

    auto descriptors = json::json_array();
    size_t error_count = 0;

    for (const auto& source : manifest.classes) {
        descriptor::ClassDescriptor descriptor(source.name);
        auto report = expander.expand_class(source, descriptor);
        for (const auto& error : report.errors) {
            err << format_diagnostic(error) << "\n";
        }
        error_count += report.errors.size();
        descriptors.push(descriptor.to_json());
    }

    out << render_json(descriptors) << "\n";

    if (error_count > 0) {
        NOTATE_LOG_INFO("cli", error_count << " annotation error(s)");
        return 1;
    }
    return 0;
}

int run_expand(const std::string& manifest_path) {
    auto text = read_file(manifest_path);
    if (!text) {
        std::cerr << "error: cannot open file: " << manifest_path << "\n";
        return 1;
    }

    auto manifest = load_manifest(*text);
    if (is_err(manifest)) {
        std::cerr << manifest_path << ": error: " << unwrap_err(manifest) << "\n";
        return 1;
    }

    auto registry = annotation::AnnotationRegistry::with_builtins();
    return expand_manifest_to(unwrap(manifest), registry, std::cout, std::cerr);
}

// ============================================================================
// parse
// ============================================================================

int parse_comment_to(const std::string& comment, std::ostream& out, std::ostream& err) {
    auto directives = annotation::extract_directives(comment);
    if (directives.empty()) {
        NOTATE_LOG_DEBUG("cli", "No directives found");
        return 0;
    }

    int status = 0;
    for (const auto& invocation : directives) {
        auto params = annotation::evaluate_arguments(invocation.argument_text);
        if (is_err(params)) {
            err << "error: !" << invocation.name << ": " << unwrap_err(params).to_string()
                << "\n";
            status = 1;
            continue;
        }
        out << "!" << invocation.name << " " << render_json(unwrap(params).to_json()) << "\n";
    }
    return status;
}

int run_parse(const std::string& text_or_file) {
    std::string comment = text_or_file;
    if (!text_or_file.empty() && text_or_file.front() == '@') {
        auto path = text_or_file.substr(1);
        auto contents = read_file(path);
        if (!contents) {
            std::cerr << "error: cannot open file: " << path << "\n";
            return 1;
        }
        comment = std::move(*contents);
    }
    return parse_comment_to(comment, std::cout, std::cerr);
}

// ============================================================================
// list
// ============================================================================

void list_annotations_to(const annotation::AnnotationRegistry& registry, std::ostream& out) {
    for (const auto& name : registry.names()) {
        static const size_t suffix_len = std::string(annotation::ANNOTATION_SUFFIX).size();
        auto directive = name.substr(0, name.size() - suffix_len);
        auto instance = registry.lookup(directive);
        if (is_err(instance)) {
            continue;
        }
        const auto& kind = unwrap(instance);
        out << name << " (" << kind->is_for().describe() << ")\n";

        std::istringstream usage(kind->usage());
        std::string line;
        while (std::getline(usage, line)) {
            out << "    " << line << "\n";
        }
    }
}

int run_list() {
    auto registry = annotation::AnnotationRegistry::with_builtins();
    list_annotations_to(registry, std::cout);
    return 0;
}

} // namespace notate::cli

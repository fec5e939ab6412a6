#include "annotation/annotation.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace notate::annotation {

auto state_name(AnnotationState state) -> const char* {
    switch (state) {
    case AnnotationState::Parsed:
        return "parsed";
    case AnnotationState::TypeChecked:
        return "type-checked";
    case AnnotationState::Validated:
        return "validated";
    case AnnotationState::Bound:
        return "bound";
    case AnnotationState::Expanded:
        return "expanded";
    case AnnotationState::Failed:
        return "failed";
    }
    return "unknown";
}

auto join_values(const std::vector<std::string>& values) -> std::string {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += values[i];
    }
    return out;
}

namespace {

auto contains_value(const std::vector<std::string>& set, const std::string& value) -> bool {
    return std::find(set.begin(), set.end(), value) != set.end();
}

auto lower_all(const std::vector<std::string>& keys) -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(keys.size());
    for (const auto& key : keys) {
        out.push_back(to_lower(key));
    }
    return out;
}

const ParameterList EMPTY_PARAMETERS{};

} // namespace

// ============================================================================
// Parameters
// ============================================================================

void Annotation::init(ParameterList parameters) {
    parameters_ = std::move(parameters);
    values_.clear();
    errors_.clear();
    state_ = AnnotationState::Parsed;
}

auto Annotation::pending() const -> const ParameterList& {
    return parameters_ ? *parameters_ : EMPTY_PARAMETERS;
}

auto Annotation::is_a_value(const std::string& value) const -> bool {
    const auto& params = pending();
    for (const auto& v : params.positional()) {
        if (v.to_string() == value) {
            return true;
        }
    }
    for (const auto& [key, v] : params.keyed()) {
        if (v.to_string() == value) {
            return true;
        }
    }
    for (const auto& v : values_) {
        if (v.to_string() == value) {
            return true;
        }
    }
    return false;
}

auto Annotation::value_not_in(const std::vector<std::string>& allowed) const
    -> std::optional<Value> {
    const auto& params = pending();
    for (const auto& v : params.positional()) {
        if (!contains_value(allowed, v.to_string())) {
            return v;
        }
    }
    for (const auto& [key, v] : params.keyed()) {
        if (!contains_value(allowed, v.to_string())) {
            return v;
        }
    }
    for (const auto& v : values_) {
        if (!contains_value(allowed, v.to_string())) {
            return v;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Key Binding
// ============================================================================

void Annotation::bind_key(const std::string& key, KeySetter setter) {
    auto lower = to_lower(key);
    for (auto& [k, s] : bindings_) {
        if (k == lower) {
            s = std::move(setter);
            return;
        }
    }
    bindings_.emplace_back(std::move(lower), std::move(setter));
}

void Annotation::bind_key(const std::string& key, std::string& field) {
    bind_key(key, [&field](const Value& value) { field = value.to_string(); });
}

void Annotation::bind_key(const std::string& key, bool& field) {
    bind_key(key, [&field](const Value& value) { field = value.truthy(); });
}

void Annotation::bind_key(const std::string& key, std::optional<std::string>& field) {
    bind_key(key, [&field](const Value& value) { field = value.to_string(); });
}

auto Annotation::find_setter(const std::string& key) const -> const KeySetter* {
    auto lower = to_lower(key);
    for (const auto& [k, setter] : bindings_) {
        if (k == lower) {
            return &setter;
        }
    }
    return nullptr;
}

auto Annotation::is_bound_key(const std::string& key) const -> bool {
    return find_setter(key) != nullptr;
}

// ============================================================================
// Validation Primitives
// ============================================================================

void Annotation::add_error(std::string message) {
    if (contains_value(errors_, message)) {
        return;
    }
    errors_.push_back(std::move(message));
}

void Annotation::required_keys(const std::vector<std::string>& keys) {
    for (const auto& key : lower_all(keys)) {
        if (!pending().contains(key)) {
            add_error(class_name() + " requires a '" + key + "' parameter.");
        }
    }
}

void Annotation::accepted_keys(const std::vector<std::string>& keys) {
    auto allowed = lower_all(keys);
    for (const auto& [key, value] : pending().keyed()) {
        if (!contains_value(allowed, key)) {
            add_error("Invalid parameter: \"" + key + "\".");
        }
    }
}

void Annotation::accepted_keyless_values(const std::vector<std::string>& values) {
    for (const auto& value : pending().positional()) {
        auto text = value.to_string();
        if (!contains_value(values, text)) {
            add_error("Unknown parameter: \"" + text + "\".");
        }
    }
}

void Annotation::accepted_indexed_values(size_t index, const std::vector<std::string>& values) {
    const Value* value = pending().at(index);
    if (value == nullptr) {
        add_error("Parameter " + std::to_string(index) + " is missing. Valid values: " +
                  join_values(values) + ".");
        return;
    }
    auto text = value->to_string();
    if (!contains_value(values, text)) {
        add_error("Parameter " + std::to_string(index) + " is set to \"" + text +
                  "\". Valid values: " + join_values(values) + ".");
    }
}

void Annotation::accepted_values_for_key(const std::string& key,
                                         const std::vector<std::string>& values,
                                         CaseNormalization normalization) {
    auto lower = to_lower(key);
    const Value* value = pending().get(lower);
    if (value == nullptr) {
        return;
    }

    auto text = value->to_string();
    std::string compared = text;
    if (normalization == CaseNormalization::Lower) {
        compared = to_lower(text);
    } else if (normalization == CaseNormalization::Upper) {
        compared = to_upper(text);
    }

    if (!contains_value(values, compared)) {
        add_error("The \"" + lower + "\" parameter is set to \"" + text +
                  "\". Valid values: " + join_values(values) + ".");
    }
}

void Annotation::valid_on_subclasses_of(const ClassHierarchy& hierarchy,
                                        const std::string& class_name, const std::string& base) {
    if (!hierarchy.is_subclass_of(class_name, base)) {
        add_error(this->class_name() + " is only valid on objects of type " + base + ".");
    }
}

void Annotation::minimum_parameter_count(size_t count) {
    if (pending().size() < count) {
        add_error(class_name() + " takes at least " + std::to_string(count) + " parameters.");
    }
}

void Annotation::maximum_parameter_count(size_t count) {
    if (pending().size() > count) {
        add_error(class_name() + " takes at most " + std::to_string(count) + " parameters.");
    }
}

void Annotation::exact_parameter_count(size_t count) {
    if (pending().size() != count) {
        add_error(class_name() + " requires exactly " + std::to_string(count) + " parameters.");
    }
}

// ============================================================================
// Expansion
// ============================================================================

auto Annotation::compose_diagnostic(const Target& target, bool type_error) const -> std::string {
    std::string message = "Invalid " + class_name() + " on " + target.describe() + ". ";
    if (!type_error) {
        message += "Expected usage: \n" + usage();
    }
    message += "\n == Errors == \n * ";
    for (size_t i = 0; i < errors_.size(); ++i) {
        if (i > 0) {
            message += "\n * ";
        }
        message += errors_[i];
    }
    return message;
}

void Annotation::bind() {
    if (parameters_) {
        for (const auto& [key, value] : parameters_->keyed()) {
            if (const KeySetter* setter = find_setter(key)) {
                (*setter)(value);
            }
        }
        for (const auto& value : parameters_->positional()) {
            values_.push_back(value);
        }
    }
    // Bound values are now the only copy
    parameters_.reset();
}

auto Annotation::expand_annotation(const Target& target, descriptor::ClassDescriptor& descriptor,
                                   const ClassHierarchy& hierarchy)
    -> Result<descriptor::ClassDescriptor*, AnnotationError> {
    if (state_ != AnnotationState::Parsed) {
        AnnotationError error;
        error.kind = AnnotationErrorKind::Invalid;
        error.annotation = class_name();
        error.message = class_name() + " has already been " + state_name(state_) + ".";
        error.file = target.file;
        error.line = target.line;
        return error;
    }

    bool type_error = false;
    if (!is_for().contains(target.kind)) {
        add_error(class_name() + " is only valid on " + is_for().describe() + ".");
        type_error = true;
    }
    state_ = AnnotationState::TypeChecked;

    validate(target.class_name, hierarchy);
    for (const auto& [key, value] : pending().keyed()) {
        if (!is_bound_key(key)) {
            add_error("Invalid parameter: \"" + key + "\".");
        }
    }

    if (!errors_.empty()) {
        state_ = AnnotationState::Failed;

        AnnotationError error;
        error.kind = AnnotationErrorKind::Invalid;
        error.annotation = class_name();
        error.message = compose_diagnostic(target, type_error);
        error.errors = errors_;
        error.file = target.file;
        error.line = target.line;
        error.type_error = type_error;

        NOTATE_LOG_DEBUG("expand", class_name() << " failed on " << target.describe() << " with "
                                                << errors_.size() << " error(s)");
        return error;
    }
    state_ = AnnotationState::Validated;

    bind();
    state_ = AnnotationState::Bound;

    expand(target, descriptor);
    state_ = AnnotationState::Expanded;

    NOTATE_LOG_TRACE("expand", class_name() << " expanded on " << target.describe());
    return &descriptor;
}

} // namespace notate::annotation

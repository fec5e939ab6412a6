#include "annotation/error.hpp"

namespace notate::annotation {

auto error_kind_name(AnnotationErrorKind kind) -> const char* {
    switch (kind) {
    case AnnotationErrorKind::Parse:
        return "parse";
    case AnnotationErrorKind::UnknownAnnotation:
        return "unknown-annotation";
    case AnnotationErrorKind::Invalid:
        return "invalid";
    }
    return "unknown";
}

auto AnnotationError::to_string() const -> std::string {
    if (file.empty()) {
        return message;
    }
    return file + ":" + std::to_string(line) + ": " + message;
}

auto AnnotationError::to_json() const -> json::JsonValue {
    auto list = json::json_array();
    for (const auto& e : errors) {
        list.push(json::JsonValue(e));
    }

    auto obj = json::json_object();
    obj.set("kind", json::JsonValue(error_kind_name(kind)));
    obj.set("annotation", json::JsonValue(annotation));
    obj.set("message", json::JsonValue(message));
    obj.set("errors", std::move(list));
    obj.set("file", json::JsonValue(file));
    obj.set("line", json::JsonValue(static_cast<int64_t>(line)));
    obj.set("type_error", json::JsonValue(type_error));
    return obj;
}

} // namespace notate::annotation

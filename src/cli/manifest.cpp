#include "cli/manifest.hpp"

#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <limits>
#include <optional>

namespace notate::cli {

using json::JsonValue;

namespace {

auto optional_string(const JsonValue& obj, const std::string& key, const std::string& path,
                     std::string& out) -> std::optional<std::string> {
    const JsonValue* value = obj.get(key);
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        return path + "." + key + ": expected a string";
    }
    out = value->as_string();
    return std::nullopt;
}

auto optional_line(const JsonValue& obj, const std::string& path, int& out)
    -> std::optional<std::string> {
    const JsonValue* value = obj.get("line");
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (!value->is_integer()) {
        return path + ".line: expected an integer";
    }
    auto line = value->as_i64();
    if (line < 0 || line > std::numeric_limits<int>::max()) {
        return path + ".line: out of range (" + std::to_string(line) + ")";
    }
    out = static_cast<int>(line);
    return std::nullopt;
}

auto load_members(const JsonValue& cls, const std::string& key, const std::string& path,
                  std::vector<annotation::MemberSource>& out) -> std::optional<std::string> {
    const JsonValue* members = cls.get(key);
    if (members == nullptr || members->is_null()) {
        return std::nullopt;
    }
    if (!members->is_array()) {
        return path + "." + key + ": expected an array";
    }

    for (size_t i = 0; i < members->size(); ++i) {
        const JsonValue& member = (*members)[i];
        auto member_path = path + "." + key + "[" + std::to_string(i) + "]";
        if (!member.is_object()) {
            return member_path + ": expected an object";
        }

        annotation::MemberSource source;
        const JsonValue* name = member.get("name");
        if (name == nullptr || !name->is_string()) {
            return member_path + ".name: expected a string";
        }
        source.name = name->as_string();

        if (auto err = optional_line(member, member_path, source.line)) {
            return err;
        }
        if (auto err = optional_string(member, "doc", member_path, source.comment)) {
            return err;
        }
        out.push_back(std::move(source));
    }
    return std::nullopt;
}

auto load_class(const JsonValue& cls, const std::string& path, annotation::ClassSource& out)
    -> std::optional<std::string> {
    if (!cls.is_object()) {
        return path + ": expected an object";
    }
    const JsonValue* name = cls.get("name");
    if (name == nullptr || !name->is_string()) {
        return path + ".name: expected a string";
    }
    out.name = name->as_string();

    if (auto err = optional_string(cls, "file", path, out.file)) {
        return err;
    }
    if (auto err = optional_line(cls, path, out.line)) {
        return err;
    }
    if (auto err = optional_string(cls, "doc", path, out.comment)) {
        return err;
    }
    if (auto err = load_members(cls, "properties", path, out.properties)) {
        return err;
    }
    return load_members(cls, "methods", path, out.methods);
}

} // namespace

auto load_manifest(std::string_view json_text) -> Result<Manifest, std::string> {
    auto parsed = json::parse_json(json_text);
    if (is_err(parsed)) {
        return "invalid JSON: " + unwrap_err(parsed).to_string();
    }
    const JsonValue& root = unwrap(parsed);
    if (!root.is_object()) {
        return std::string("manifest: expected an object");
    }

    Manifest manifest;

    if (const JsonValue* hierarchy = root.get("hierarchy")) {
        if (!hierarchy->is_object()) {
            return std::string("hierarchy: expected an object");
        }
        for (const auto& [cls, parent] : hierarchy->as_object()) {
            if (!parent.is_string()) {
                return "hierarchy." + cls + ": expected a string";
            }
            manifest.hierarchy.declare(cls, parent.as_string());
        }
    }

    const JsonValue* classes = root.get("classes");
    if (classes == nullptr || !classes->is_array()) {
        return std::string("classes: expected an array");
    }
    for (size_t i = 0; i < classes->size(); ++i) {
        annotation::ClassSource source;
        if (auto err = load_class((*classes)[i], "classes[" + std::to_string(i) + "]", source)) {
            return *err;
        }
        manifest.classes.push_back(std::move(source));
    }

    NOTATE_LOG_DEBUG("cli", "Loaded manifest with " << manifest.classes.size() << " class(es), "
                                                    << manifest.hierarchy.size()
                                                    << " hierarchy entries");
    return manifest;
}

} // namespace notate::cli

//! # CLI Tests
//!
//! Tests for manifest loading and the `expand`, `parse` and `list`
//! commands, driven through their stream-based entry points.

#include "annotation/registry.hpp"
#include "cli/commands.hpp"
#include "cli/manifest.hpp"
#include "cli/utils.hpp"
#include "common.hpp"
#include "json/json_parser.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace notate;
using namespace notate::cli;

namespace {

const char* USERS_MANIFEST = R"({
    "hierarchy": {
        "Controller": "Object",
        "UsersController": "Controller",
        "Model": "Object",
        "User": "Model"
    },
    "classes": [
        {
            "name": "UsersController",
            "file": "users.php",
            "line": 3,
            "doc": "/** !Prefix users/ */",
            "methods": [
                {"name": "index", "line": 6, "doc": "/** !Route GET, list, name: users.index */"},
                {"name": "show", "line": 9, "doc": "/** !Route GET, ':id' */"}
            ]
        },
        {
            "name": "User",
            "file": "user.php",
            "line": 2,
            "doc": "/** !Table users */",
            "properties": [
                {"name": "id", "line": 4, "doc": "/** !Column integer, PrimaryKey */"}
            ]
        }
    ]
})";

auto load_ok(const char* text) -> Manifest {
    auto result = load_manifest(text);
    EXPECT_TRUE(is_ok(result));
    if (is_err(result)) {
        return Manifest{};
    }
    return std::move(unwrap(result));
}

auto flags_of(std::vector<std::string> args) -> Result<std::vector<std::string>, std::string> {
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_command_flags(static_cast<int>(argv.size()), argv.data());
}

auto load_error(const char* text) -> std::string {
    auto result = load_manifest(text);
    EXPECT_TRUE(is_err(result));
    if (is_ok(result)) {
        return "";
    }
    return unwrap_err(result);
}

} // namespace

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        NotateOptions::pretty_output = false;
        NotateOptions::diagnostic_format = DiagnosticFormat::Text;
    }

    void TearDown() override {
        NotateOptions::pretty_output = false;
        NotateOptions::diagnostic_format = DiagnosticFormat::Text;
    }

    annotation::AnnotationRegistry registry = annotation::AnnotationRegistry::with_builtins();
    std::ostringstream out;
    std::ostringstream err;
};

// ============================================================================
// Manifest
// ============================================================================

TEST(ManifestTest, LoadsClassesAndHierarchy) {
    auto manifest = load_ok(USERS_MANIFEST);

    ASSERT_EQ(manifest.classes.size(), 2u);
    EXPECT_TRUE(manifest.hierarchy.is_subclass_of("UsersController", "Controller"));
    EXPECT_TRUE(manifest.hierarchy.is_subclass_of("User", "Object"));

    const auto& users = manifest.classes[0];
    EXPECT_EQ(users.name, "UsersController");
    EXPECT_EQ(users.file, "users.php");
    EXPECT_EQ(users.line, 3);
    EXPECT_EQ(users.comment, "/** !Prefix users/ */");
    EXPECT_TRUE(users.properties.empty());
    ASSERT_EQ(users.methods.size(), 2u);
    EXPECT_EQ(users.methods[1].name, "show");
    EXPECT_EQ(users.methods[1].line, 9);
}

TEST(ManifestTest, OptionalFieldsDefault) {
    auto manifest = load_ok(R"({"classes": [{"name": "Bare"}]})");

    ASSERT_EQ(manifest.classes.size(), 1u);
    EXPECT_TRUE(manifest.classes[0].file.empty());
    EXPECT_EQ(manifest.classes[0].line, 0);
    EXPECT_EQ(manifest.hierarchy.size(), 0u);
}

TEST(ManifestTest, ErrorsNameThePath) {
    EXPECT_EQ(load_error("[]"), "manifest: expected an object");
    EXPECT_EQ(load_error("{}"), "classes: expected an array");
    EXPECT_EQ(load_error(R"({"hierarchy": [], "classes": []})"), "hierarchy: expected an object");
    EXPECT_EQ(load_error(R"({"hierarchy": {"A": 1}, "classes": []})"),
              "hierarchy.A: expected a string");
    EXPECT_EQ(load_error(R"({"classes": [{"line": 1}]})"), "classes[0].name: expected a string");
    EXPECT_EQ(load_error(R"({"classes": [{"name": "A", "line": "x"}]})"),
              "classes[0].line: expected an integer");
    EXPECT_EQ(load_error(R"({"classes": [{"name": "A", "methods": {}}]})"),
              "classes[0].methods: expected an array");
    EXPECT_EQ(load_error(R"({"classes": [{"name": "A", "properties": [{"name": "p", "doc": 1}]}]})"),
              "classes[0].properties[0].doc: expected a string");
}

TEST(ManifestTest, LineOutOfRange) {
    EXPECT_EQ(load_error(R"({"classes": [{"name": "A", "line": 4294967297}]})"),
              "classes[0].line: out of range (4294967297)");
    EXPECT_EQ(load_error(R"({"classes": [{"name": "A", "methods": [{"name": "m", "line": -1}]}]})"),
              "classes[0].methods[0].line: out of range (-1)");
}

TEST(ManifestTest, InvalidJson) {
    EXPECT_EQ(load_error("{"), "invalid JSON: line 1, column 2: Expected string key in object");
}

// ============================================================================
// expand
// ============================================================================

TEST_F(CliTest, ExpandWritesDescriptors) {
    auto manifest = load_ok(USERS_MANIFEST);

    EXPECT_EQ(expand_manifest_to(manifest, registry, out, err), 0);
    EXPECT_TRUE(err.str().empty());

    auto parsed = json::parse_json(out.str());
    ASSERT_TRUE(is_ok(parsed));
    const auto& descriptors = unwrap(parsed);
    ASSERT_EQ(descriptors.size(), 2u);

    const auto& users = descriptors[0];
    EXPECT_EQ(users.get("class")->as_string(), "UsersController");
    EXPECT_EQ(users.get("route_prefix")->as_string(), "users/");
    const auto& routes = *users.get("routes");
    ASSERT_EQ(routes.size(), 2u);
    EXPECT_EQ(routes[0].get("path")->as_string(), "users/list");
    EXPECT_EQ(routes[1].get("path")->as_string(), "users/:id");
    EXPECT_EQ(routes[1].get("handler")->as_string(), "show");

    const auto& user = descriptors[1];
    EXPECT_EQ(user.get("table")->as_string(), "users");
    EXPECT_EQ(user.get("primary_key")->as_string(), "id");
}

TEST_F(CliTest, ExpandReportsDiagnostics) {
    auto manifest = load_ok(R"({
        "hierarchy": {"UsersController": "Controller"},
        "classes": [{
            "name": "UsersController",
            "file": "users.php",
            "methods": [
                {"name": "a", "line": 4, "doc": "/** !Bogus */"},
                {"name": "b", "line": 7, "doc": "/** !Route GET, ok */"}
            ]
        }]
    })");

    EXPECT_EQ(expand_manifest_to(manifest, registry, out, err), 1);
    EXPECT_EQ(err.str(), "users.php:4: error: Unknown annotation: \"Bogus\". It must be "
                         "registered as \"BogusAnnotation\" before use.\n");

    // The valid sibling still expanded
    auto parsed = json::parse_json(out.str());
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_EQ(unwrap(parsed)[0].get("routes")->size(), 1u);
}

TEST_F(CliTest, ExpandJsonDiagnostics) {
    NotateOptions::diagnostic_format = DiagnosticFormat::JSON;
    auto manifest = load_ok(R"({"classes": [{"name": "A", "doc": "!Route 'x"}]})");

    EXPECT_EQ(expand_manifest_to(manifest, registry, out, err), 1);

    auto line = err.str();
    ASSERT_FALSE(line.empty());
    line.pop_back();
    auto parsed = json::parse_json(line);
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_EQ(unwrap(parsed).get("kind")->as_string(), "parse");
    EXPECT_EQ(unwrap(parsed).get("annotation")->as_string(), "RouteAnnotation");
}

TEST_F(CliTest, ExpandPrettyOutput) {
    NotateOptions::pretty_output = true;
    auto manifest = load_ok(R"({"classes": [{"name": "Plain"}]})");

    EXPECT_EQ(expand_manifest_to(manifest, registry, out, err), 0);
    EXPECT_EQ(out.str(), "[\n  {\n    \"class\": \"Plain\"\n  }\n]\n");
}

// ============================================================================
// parse
// ============================================================================

TEST_F(CliTest, ParsePrintsEvaluatedParameters) {
    EXPECT_EQ(parse_comment_to("/** !Route GET, '/users', name: users.index */", out, err), 0);
    EXPECT_EQ(out.str(),
              "!Route {\"keyed\":{\"name\":\"users.index\"},\"positional\":[\"GET\",\"/users\"]}\n");
}

TEST_F(CliTest, ParseReportsEvaluationErrors) {
    EXPECT_EQ(parse_comment_to("!Table users\n!Column (a\n", out, err), 1);
    EXPECT_EQ(out.str(), "!Table {\"keyed\":{},\"positional\":[\"users\"]}\n");
    EXPECT_EQ(err.str(), "error: !Column: unbalanced parentheses: missing ')' in \"(a\"\n");
}

TEST_F(CliTest, ParseWithoutDirectives) {
    EXPECT_EQ(parse_comment_to("/** Nothing here. */", out, err), 0);
    EXPECT_TRUE(out.str().empty());
}

// ============================================================================
// list
// ============================================================================

TEST_F(CliTest, ListShowsKindsTargetsAndUsage) {
    list_annotations_to(registry, out);
    auto text = out.str();

    EXPECT_EQ(text.rfind("BelongsToAnnotation (Classes)\n    !BelongsTo relationName", 0), 0u);
    EXPECT_NE(text.find("ColumnAnnotation (Properties)\n    !Column type"), std::string::npos);
    EXPECT_NE(text.find("RouteAnnotation (Methods)\n    !Route METHOD, path[, name: routeName]\n"),
              std::string::npos);
    EXPECT_NE(text.find("TableAnnotation (Classes)\n    !Table tableName\n"), std::string::npos);
}

// ============================================================================
// Command Flags
// ============================================================================

TEST_F(CliTest, FlagsSetOptionsAndKeepOperands) {
    auto result = flags_of({"notate", "expand", "m.json", "--pretty", "--diagnostic-format=json",
                            "-vv", "--log-filter=cli=debug", "-"});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), (std::vector<std::string>{"m.json", "-"}));
    EXPECT_TRUE(NotateOptions::pretty_output);
    EXPECT_EQ(NotateOptions::diagnostic_format, DiagnosticFormat::JSON);
}

TEST_F(CliTest, FlagsRejectUnknownOptions) {
    auto typo = flags_of({"notate", "expand", "m.json", "--prety"});
    ASSERT_TRUE(is_err(typo));
    EXPECT_EQ(unwrap_err(typo), "unknown option: --prety");
    EXPECT_FALSE(NotateOptions::pretty_output);

    auto format = flags_of({"notate", "expand", "m.json", "--diagnostic-format=xml"});
    ASSERT_TRUE(is_err(format));
    EXPECT_EQ(unwrap_err(format), "unknown diagnostic format: xml");
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST_F(CliTest, FormatDiagnosticText) {
    annotation::AnnotationError error;
    error.message = "Something failed";
    EXPECT_EQ(format_diagnostic(error), "error: Something failed");

    error.file = "user.php";
    error.line = 12;
    EXPECT_EQ(format_diagnostic(error), "user.php:12: error: Something failed");
}

TEST(ReadFileTest, MissingFile) {
    EXPECT_FALSE(read_file("/nonexistent/notate/manifest.json").has_value());
}

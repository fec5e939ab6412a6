//! # Validation Framework Tests
//!
//! Tests for the annotation lifecycle and the reusable validation
//! primitives, driven through `MarkerAnnotation`.

#include "annotation/annotation.hpp"
#include "descriptor/class_descriptor.hpp"
#include "marker_annotation.hpp"

#include <gtest/gtest.h>

using namespace notate;
using namespace notate::annotation;
using notate::test::make_marker;
using notate::test::MarkerAnnotation;

class ValidationTest : public ::testing::Test {
protected:
    void SetUp() override {
        hierarchy.declare("Controller", "Base");
        hierarchy.declare("UsersController", "Controller");
        hierarchy.declare("AdminController", "UsersController");
        hierarchy.declare("User", "Model");
    }

    auto method_target(const std::string& cls = "UsersController",
                       const std::string& method = "show") -> Target {
        return Target{TargetKind::Method, cls, method, "users.php", 12};
    }

    auto run(MarkerAnnotation& marker, const Target& target)
        -> Result<descriptor::ClassDescriptor*, AnnotationError> {
        return marker.expand_annotation(target, descriptor, hierarchy);
    }

    StaticClassHierarchy hierarchy;
    descriptor::ClassDescriptor descriptor{"UsersController"};
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(ValidationTest, SuccessfulExpansionWalksEveryState) {
    auto marker = make_marker("/users, label: users.index");
    EXPECT_EQ(marker->state(), AnnotationState::Parsed);
    ASSERT_NE(marker->parameters(), nullptr);

    auto result = run(*marker, method_target());

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), &descriptor);
    EXPECT_EQ(marker->state(), AnnotationState::Expanded);
    EXPECT_EQ(marker->expand_calls, 1);
    EXPECT_TRUE(marker->errors().empty());

    ASSERT_EQ(descriptor.routes().size(), 1u);
    EXPECT_EQ(descriptor.routes()[0].path, "/users");
    EXPECT_EQ(descriptor.routes()[0].handler, "show");
    EXPECT_EQ(descriptor.routes()[0].name, "users.index");
}

TEST_F(ValidationTest, BindingMovesParametersIntoValues) {
    auto marker = make_marker("/users, flag: yes");
    ASSERT_TRUE(is_ok(run(*marker, method_target())));

    EXPECT_EQ(marker->parameters(), nullptr);
    ASSERT_EQ(marker->values().size(), 1u);
    EXPECT_EQ(marker->values()[0], Value("/users"));
    EXPECT_TRUE(marker->flag);
    EXPECT_TRUE(marker->label.empty());
}

TEST_F(ValidationTest, SecondExpansionIsRejected) {
    auto marker = make_marker("/users");
    ASSERT_TRUE(is_ok(run(*marker, method_target())));

    auto again = run(*marker, method_target());

    ASSERT_TRUE(is_err(again));
    EXPECT_EQ(unwrap_err(again).message, "MarkerAnnotation has already been expanded.");
    EXPECT_EQ(marker->expand_calls, 1);
    EXPECT_EQ(descriptor.routes().size(), 1u);
}

TEST_F(ValidationTest, InitResetsFailedInstance) {
    auto marker = make_marker("/users, bogus: 1");
    ASSERT_TRUE(is_err(run(*marker, method_target())));
    EXPECT_EQ(marker->state(), AnnotationState::Failed);

    marker->init(unwrap(evaluate_arguments("/users")));
    EXPECT_EQ(marker->state(), AnnotationState::Parsed);
    EXPECT_TRUE(marker->errors().empty());
    EXPECT_TRUE(is_ok(run(*marker, method_target())));
}

TEST_F(ValidationTest, FailedInstanceNeverExpands) {
    auto marker = make_marker("/users");
    marker->rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.add_error("first problem");
    };

    auto result = run(*marker, method_target());

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(marker->state(), AnnotationState::Failed);
    EXPECT_EQ(marker->expand_calls, 0);
    EXPECT_TRUE(descriptor.routes().empty());
    EXPECT_NE(marker->parameters(), nullptr);
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST_F(ValidationTest, DiagnosticListsUsageAndEveryError) {
    auto marker = make_marker("/users, bogus: 1");
    marker->rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.maximum_parameter_count(1);
    };

    auto result = run(*marker, method_target());

    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.kind, AnnotationErrorKind::Invalid);
    EXPECT_EQ(error.annotation, "MarkerAnnotation");
    EXPECT_EQ(error.file, "users.php");
    EXPECT_EQ(error.line, 12);
    EXPECT_FALSE(error.type_error);
    ASSERT_EQ(error.errors.size(), 2u);
    EXPECT_EQ(error.errors[0], "MarkerAnnotation takes at most 1 parameters.");
    EXPECT_EQ(error.errors[1], "Invalid parameter: \"bogus\".");
    EXPECT_EQ(error.message, "Invalid MarkerAnnotation on method \"show\". Expected usage: \n"
                             "!Marker value[, label: text]\n"
                             " == Errors == \n"
                             " * MarkerAnnotation takes at most 1 parameters.\n"
                             " * Invalid parameter: \"bogus\".");
}

TEST_F(ValidationTest, TypeErrorOmitsUsage) {
    MarkerAnnotation only_class(TargetKind::Class);
    only_class.init(unwrap(evaluate_arguments("/users")));

    auto result = run(only_class, method_target());

    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_TRUE(error.type_error);
    EXPECT_EQ(error.message, "Invalid MarkerAnnotation on method \"show\". \n"
                             " == Errors == \n"
                             " * MarkerAnnotation is only valid on Classes.");
    EXPECT_EQ(only_class.expand_calls, 0);
}

TEST_F(ValidationTest, TypeErrorStillRunsValidation) {
    MarkerAnnotation marker(TargetKind::Class);
    marker.init(unwrap(evaluate_arguments("")));
    marker.rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.exact_parameter_count(1);
    };

    auto result = run(marker, method_target());

    ASSERT_TRUE(is_err(result));
    ASSERT_EQ(unwrap_err(result).errors.size(), 2u);
    EXPECT_EQ(unwrap_err(result).errors[1], "MarkerAnnotation requires exactly 1 parameters.");
}

TEST_F(ValidationTest, PropertyTargetDescription) {
    MarkerAnnotation marker(TargetKind::Method);
    marker.init(unwrap(evaluate_arguments("x")));

    auto result = run(marker, Target{TargetKind::Property, "User", "email", "user.php", 3});

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message,
              "Invalid MarkerAnnotation on property \"email\" of class \"User\". \n"
              " == Errors == \n"
              " * MarkerAnnotation is only valid on Methods.");
}

TEST_F(ValidationTest, IdenticalErrorsRecordedOnce) {
    auto marker = make_marker("x");
    marker->rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.add_error("same");
        p.add_error("same");
    };

    auto result = run(*marker, method_target());

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).errors.size(), 1u);
}

// ============================================================================
// Primitives
// ============================================================================

TEST_F(ValidationTest, RequiredKeys) {
    auto marker = make_marker("x, label: a");
    marker->rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.required_keys({"Label", "flag"});
    };

    auto result = run(*marker, method_target());

    ASSERT_TRUE(is_err(result));
    ASSERT_EQ(unwrap_err(result).errors.size(), 1u);
    EXPECT_EQ(unwrap_err(result).errors[0], "MarkerAnnotation requires a 'flag' parameter.");
}

TEST_F(ValidationTest, AcceptedKeys) {
    auto marker = make_marker("x, label: a, flag: true");
    marker->rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.accepted_keys({"LABEL"});
    };

    auto result = run(*marker, method_target());

    ASSERT_TRUE(is_err(result));
    ASSERT_EQ(unwrap_err(result).errors.size(), 1u);
    EXPECT_EQ(unwrap_err(result).errors[0], "Invalid parameter: \"flag\".");
}

TEST_F(ValidationTest, AcceptsNoKeyedValues) {
    auto marker = make_marker("x, label: a");
    marker->rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.accepts_no_keyed_values();
    };

    auto result = run(*marker, method_target());

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).errors[0], "Invalid parameter: \"label\".");
}

TEST_F(ValidationTest, AcceptedKeylessValues) {
    auto marker = make_marker("Cascade, Nullify");
    marker->rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.accepted_keyless_values({"Cascade"});
    };

    auto result = run(*marker, method_target());

    ASSERT_TRUE(is_err(result));
    ASSERT_EQ(unwrap_err(result).errors.size(), 1u);
    EXPECT_EQ(unwrap_err(result).errors[0], "Unknown parameter: \"Nullify\".");
}

TEST_F(ValidationTest, AcceptsNoKeylessValues) {
    auto marker = make_marker("x");
    marker->rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.accepts_no_keyless_values();
    };

    auto result = run(*marker, method_target());

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).errors[0], "Unknown parameter: \"x\".");
}

TEST_F(ValidationTest, AcceptedIndexedValues) {
    auto marker = make_marker("PATCH");
    marker->rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.accepted_indexed_values(0, {"GET", "POST"});
        p.accepted_indexed_values(1, {"a", "b"});
    };

    auto result = run(*marker, method_target());

    ASSERT_TRUE(is_err(result));
    ASSERT_EQ(unwrap_err(result).errors.size(), 2u);
    EXPECT_EQ(unwrap_err(result).errors[0],
              "Parameter 0 is set to \"PATCH\". Valid values: GET, POST.");
    EXPECT_EQ(unwrap_err(result).errors[1], "Parameter 1 is missing. Valid values: a, b.");
}

TEST_F(ValidationTest, AcceptedValuesForKeyWithNormalization) {
    auto marker = make_marker("x, label: get");
    marker->rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.accepted_values_for_key("label", {"GET", "POST"}, CaseNormalization::Upper);
    };

    EXPECT_TRUE(is_ok(run(*marker, method_target())));
}

TEST_F(ValidationTest, AcceptedValuesForKeyRejectsCase) {
    auto marker = make_marker("x, label: get");
    marker->rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.accepted_values_for_key("Label", {"GET", "POST"});
    };

    auto result = run(*marker, method_target());

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).errors[0],
              "The \"label\" parameter is set to \"get\". Valid values: GET, POST.");
}

TEST_F(ValidationTest, AcceptedValuesForAbsentKeyPasses) {
    auto marker = make_marker("x");
    marker->rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.accepted_values_for_key("label", {"a"});
    };

    EXPECT_TRUE(is_ok(run(*marker, method_target())));
}

TEST_F(ValidationTest, ValidOnSubclassesIsTransitiveAndStrict) {
    auto check = [this](const std::string& cls) {
        auto marker = make_marker("x");
        marker->rules = [](MarkerAnnotation& p, const std::string& class_name,
                          const ClassHierarchy& h) {
            p.valid_on_subclasses_of(h, class_name, "Controller");
        };
        return run(*marker, method_target(cls));
    };

    EXPECT_TRUE(is_ok(check("UsersController")));
    EXPECT_TRUE(is_ok(check("AdminController")));

    auto own = check("Controller");
    ASSERT_TRUE(is_err(own));
    EXPECT_EQ(unwrap_err(own).errors[0],
              "MarkerAnnotation is only valid on objects of type Controller.");
    EXPECT_TRUE(is_err(check("User")));
    EXPECT_TRUE(is_err(check("Unknown")));
}

TEST_F(ValidationTest, ParameterCountsIncludeKeyedValues) {
    auto marker = make_marker("a, b, label: c");
    marker->rules = [](MarkerAnnotation& p, const std::string&, const ClassHierarchy&) {
        p.minimum_parameter_count(4);
        p.exact_parameter_count(3);
        p.maximum_parameter_count(2);
    };

    auto result = run(*marker, method_target());

    ASSERT_TRUE(is_err(result));
    ASSERT_EQ(unwrap_err(result).errors.size(), 2u);
    EXPECT_EQ(unwrap_err(result).errors[0], "MarkerAnnotation takes at least 4 parameters.");
    EXPECT_EQ(unwrap_err(result).errors[1], "MarkerAnnotation takes at most 2 parameters.");
}

// ============================================================================
// Value Queries
// ============================================================================

TEST_F(ValidationTest, IsAValueBeforeAndAfterBinding) {
    auto marker = make_marker("PrimaryKey, label: users");

    EXPECT_TRUE(marker->is_a_value("PrimaryKey"));
    EXPECT_TRUE(marker->is_a_value("users"));
    EXPECT_FALSE(marker->is_a_value("AutoIncrement"));

    ASSERT_TRUE(is_ok(run(*marker, method_target())));
    EXPECT_TRUE(marker->is_a_value("PrimaryKey"));
    EXPECT_FALSE(marker->is_a_value("users"));
}

TEST_F(ValidationTest, ValueNotIn) {
    auto marker = make_marker("Cascade, Nullify");

    auto outside = marker->value_not_in({"Cascade"});
    ASSERT_TRUE(outside.has_value());
    EXPECT_EQ(*outside, Value("Nullify"));
    EXPECT_FALSE(marker->value_not_in({"Cascade", "Nullify"}).has_value());
}

TEST(AnnotationStateTest, Names) {
    EXPECT_STREQ(state_name(AnnotationState::Parsed), "parsed");
    EXPECT_STREQ(state_name(AnnotationState::TypeChecked), "type-checked");
    EXPECT_STREQ(state_name(AnnotationState::Failed), "failed");
}

TEST(JoinValuesTest, Joins) {
    EXPECT_EQ(join_values({}), "");
    EXPECT_EQ(join_values({"GET"}), "GET");
    EXPECT_EQ(join_values({"GET", "POST", "PUT"}), "GET, POST, PUT");
}

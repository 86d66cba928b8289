/**
 * @file test_validate.cpp
 * @brief Unit tests for static path validation (GoogleTest)
 */

#include <gtest/gtest.h>
#include "treepath/Validate.hpp"
#include "treepath/Errors.hpp"

#include <string>

using namespace treepath;

TEST(ValidatePath, AcceptsWellFormedPaths) {
    EXPECT_NO_THROW(validate_path("x.f.g.@first"));
    EXPECT_NO_THROW(validate_path("x.f.g.@last"));
    EXPECT_NO_THROW(validate_path("x.*.*.@last"));
    EXPECT_NO_THROW(validate_path("x.@first.\\*.@last"));
    EXPECT_NO_THROW(validate_path("@-3"));
    EXPECT_NO_THROW(validate_path("@0.@12"));
}

TEST(ValidatePath, KeysAreNeverRejected) {
    EXPECT_NO_THROW(validate_path("\\@abc"));
    EXPECT_NO_THROW(validate_path("a$.b#.c%.d{}.e[].f()"));
    EXPECT_NO_THROW(validate_path("a\\.b"));
    EXPECT_NO_THROW(validate_path(""));
}

TEST(ValidatePath, RejectsMalformedIndexes) {
    EXPECT_THROW(validate_path("x.@wedwe"), SyntaxError);
    EXPECT_THROW(validate_path("@+3"), SyntaxError);
    EXPECT_THROW(validate_path("@"), SyntaxError);
    EXPECT_THROW(validate_path("a.@-"), SyntaxError);
}

TEST(ValidatePath, IndexSuffixIsNotStripped) {
    EXPECT_THROW(validate_path("@1#"), SyntaxError);
}

TEST(ValidatePath, ErrorCarriesFullPath) {
    try {
        validate_path("a.b.@nope.c");
        FAIL() << "Expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_EQ(e.path(), "a.b.@nope.c");
        EXPECT_EQ(e.message(), "Array index must be either integer or @first or @last");
    }
}

TEST(ValidatePath, ValueMustBeString) {
    EXPECT_THROW(validate_path_value(Value(10)), SyntaxError);
    EXPECT_THROW(validate_path_value(Value::array({"a"})), SyntaxError);
    EXPECT_NO_THROW(validate_path_value(Value("x.@1")));
    EXPECT_THROW(validate_path_value(Value("x.@y")), SyntaxError);
}

TEST(ValidatePath, AcceptsStringArguments) {
    const std::string path = "items.@0.name";
    EXPECT_NO_THROW(validate_path(path));
    EXPECT_NO_THROW(validate_path(path.c_str()));
    EXPECT_TRUE(is_valid_path(path));
}

TEST(IsValidPath, MirrorsValidatePath) {
    EXPECT_TRUE(is_valid_path("a.*.@last"));
    EXPECT_TRUE(is_valid_path("\\@abc"));
    EXPECT_FALSE(is_valid_path("a.@second"));
    EXPECT_FALSE(is_valid_path("@1#"));
}

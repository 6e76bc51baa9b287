#include <string>
#include <gtest/gtest.h>
#include "core/errors/gate_errors.hpp"

using namespace cmdgate::core::errors;

// Stand-in validator that rejects anything containing a semicolon
Result<std::string> simulate_check(const std::string& value) {
    if (value.find(';') != std::string::npos) {
        return GateError{ErrorCategory::Injection, "value contains forbidden character sequence: ;",
                         "forbidden_sequence"};
    }
    return value;
}

TEST(ErrorModelTest, HandlesAcceptance) {
    auto result = simulate_check("list");

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "list");
}

TEST(ErrorModelTest, HandlesRejection) {
    auto result = simulate_check("list;rm");

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Injection);
    EXPECT_EQ(error.code, "forbidden_sequence");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DefaultsCodeWhenOmitted) {
    GateError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, NamesEveryCategory) {
    EXPECT_EQ(to_string(ErrorCategory::InputShape), "input_shape");
    EXPECT_EQ(to_string(ErrorCategory::Injection), "injection");
    EXPECT_EQ(to_string(ErrorCategory::Traversal), "traversal");
    EXPECT_EQ(to_string(ErrorCategory::Policy), "policy");
    EXPECT_EQ(to_string(ErrorCategory::Format), "format");
    EXPECT_EQ(to_string(ErrorCategory::PlatformPath), "platform_path");
    EXPECT_EQ(to_string(ErrorCategory::Config), "config");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}

#include <gtest/gtest.h>
#include "core/errors/guard_errors.hpp"

using namespace hookguard::core::errors;

// A dummy function to simulate a rule document that cannot be read
Result<std::string> simulate_load(bool should_fail) {
    if (should_fail) {
        return GuardError{ErrorCategory::Config, "Configuration not found", "config_not_found"};
    }
    return std::string("settings: {}");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_load(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "settings: {}");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_load(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Config);
    EXPECT_EQ(error.message, "Configuration not found");
    EXPECT_EQ(error.code, "config_not_found");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DefaultsCodeWhenOmitted) {
    GuardError error{ErrorCategory::Payload, "bad payload"};
    EXPECT_EQ(error.code, "unknown_error");
    EXPECT_EQ(to_string(error.category), "payload");
}

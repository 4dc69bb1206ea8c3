#include <gtest/gtest.h>
#include "core/errors/gate_errors.hpp"

using namespace hookgate::core::errors;

// A dummy function to simulate a state read failing
Result<std::string> simulate_read_state(bool should_fail) {
    if (should_fail) {
        return GateError{ErrorCategory::Persistence, "State file unreadable", "state_read_failed"};
    }
    return std::string("active: true");
}

Result<Ok> simulate_write_state(bool should_fail) {
    if (should_fail) {
        return GateError{ErrorCategory::Persistence, "Disk full"};
    }
    return Ok{};
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_read_state(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "active: true");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_read_state(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Persistence);
    EXPECT_EQ(error.message, "State file unreadable");
    EXPECT_EQ(error.code, "state_read_failed");
}

TEST(ErrorModelTest, VoidResultDefaultsCode) {
    EXPECT_FALSE(is_error(simulate_write_state(false)));

    auto result = simulate_write_state(true);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_error");
    EXPECT_TRUE(get_error(result).hint.empty());
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Configuration), "configuration");
    EXPECT_EQ(to_string(ErrorCategory::Envelope), "envelope");
    EXPECT_EQ(to_string(ErrorCategory::Persistence), "persistence");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}

#include <string>
#include <gtest/gtest.h>
#include "core/errors/engine_errors.hpp"

using namespace turnloom::core::errors;

// Simulates a store lookup for a thread that may not exist.
Result<std::string> simulate_lookup(bool should_fail) {
    if (should_fail) {
        return EngineError{ErrorCategory::Storage, "conversation not found",
                           codes::kConversationNotFound};
    }
    return std::string("Thread 1");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_lookup(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "Thread 1");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_lookup(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Storage);
    EXPECT_EQ(error.message, "conversation not found");
    EXPECT_EQ(error.code, "conversation_not_found");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, TakeValueMovesOut) {
    Result<std::string> result = std::string("payload");
    std::string value = take_value(result);
    EXPECT_EQ(value, "payload");
}

TEST(ErrorModelTest, StatusOkIsNotAnError) {
    Status status = ok();
    EXPECT_FALSE(is_error(status));
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Process), "process");
    EXPECT_EQ(to_string(ErrorCategory::Storage), "storage");
    EXPECT_EQ(to_string(ErrorCategory::Vendor), "vendor");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}

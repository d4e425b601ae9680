#include <gtest/gtest.h>
#include "core/errors/broker_errors.hpp"

using namespace pokeme::core::errors;

// A dummy function to simulate a lookup failing
Result<std::string> simulate_lookup(bool should_fail) {
    if (should_fail) {
        return BrokerError{ErrorCategory::NotFound, "not found", "request_not_found"};
    }
    return std::string("record");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_lookup(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "record");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_lookup(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::NotFound);
    EXPECT_EQ(error.message, "not found");
    EXPECT_EQ(error.code, "request_not_found");
}

TEST(ErrorModelTest, MapsCategoriesToHttpStatus) {
    EXPECT_EQ(http_status_for(ErrorCategory::Validation), 400);
    EXPECT_EQ(http_status_for(ErrorCategory::NotFound), 404);
    EXPECT_EQ(http_status_for(ErrorCategory::Backpressure), 429);
    EXPECT_EQ(http_status_for(ErrorCategory::Internal), 500);
}

TEST(ErrorModelTest, MapsHttpStatusBackToCategories) {
    EXPECT_EQ(category_for_http_status(400), ErrorCategory::Validation);
    EXPECT_EQ(category_for_http_status(404), ErrorCategory::NotFound);
    EXPECT_EQ(category_for_http_status(429), ErrorCategory::Backpressure);
    EXPECT_EQ(category_for_http_status(502), ErrorCategory::Transport);
}

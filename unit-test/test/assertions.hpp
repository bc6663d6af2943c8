#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include "gtest/gtest.h"

/**
 * @brief Compares two JSON documents, printing both and their JSON patch on mismatch
 */
inline ::testing::AssertionResult json_equal(const char *actual_expression,
                                             const char *expected_expression,
                                             const nlohmann::json &actual,
                                             const nlohmann::json &expected) {
    if (actual == expected) return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << "  Actual: " << actual_expression << std::endl
       << actual.dump(2) << std::endl
       << "Expected: " << expected_expression << std::endl
       << expected.dump(2) << std::endl
       << "   Patch: " << std::endl
       << nlohmann::json::diff(actual, expected).dump(2);
    return ::testing::AssertionFailure() << ss.str();
}

#define EXPECT_JSON_EQ(actual, expected) \
    EXPECT_PRED_FORMAT2(json_equal, actual, expected)

#define ASSERT_JSON_EQ(actual, expected) \
    ASSERT_PRED_FORMAT2(json_equal, actual, expected)

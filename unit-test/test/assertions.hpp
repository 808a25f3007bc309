#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include "gtest/gtest.h"

/**
 * @brief 比较两个 JSON，不相等时输出两边的内容和 JSON Patch 形式的差异
 */
inline ::testing::AssertionResult json_equal(const char *lhs_expression,
                                             const char *rhs_expression,
                                             const nlohmann::json &lhs,
                                             const nlohmann::json &rhs) {
    if (lhs == rhs) return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << lhs_expression << " is:" << std::endl
       << lhs.dump(2) << std::endl
       << rhs_expression << " is:" << std::endl
       << rhs.dump(2) << std::endl
       << "Patch from the former to the latter:" << std::endl
       << nlohmann::json::diff(lhs, rhs).dump(2);
    return ::testing::AssertionFailure() << ss.str();
}

#define EXPECT_JSON_EQ(lhs, rhs) \
    EXPECT_PRED_FORMAT2(json_equal, lhs, rhs)

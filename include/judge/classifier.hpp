#pragma once

#include <string>
#include "common/status.hpp"
#include "judge/runner.hpp"

namespace codejudge {

/**
 * @brief 判定结果以及用于展示的选手输出
 */
struct classification {
    status verdict;

    /**
     * @brief 去掉首尾空白字符的选手输出
     */
    std::string output;
};

/**
 * @brief 根据运行结果判定测试点的评测结果，按顺序匹配：
 * 1. 超时：TIME_LIMIT_EXCEEDED
 * 2. 编译失败：COMPILATION_ERROR，不比较输出
 * 3. 返回值非零，或者需要输出时没有任何输出：RUNTIME_ERROR
 * 4. 去掉首尾空白字符后与标准输出完全一致：ACCEPTED，否则 WRONG_ANSWER
 */
classification classify(const raw_execution_result &raw, const std::string &expected_output);

}  // namespace codejudge

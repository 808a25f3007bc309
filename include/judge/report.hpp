#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace codejudge {

/**
 * @brief 一个测试点的评测结果，按照测试点的顺序保存
 */
struct test_result {
    /**
     * @brief 测试点的下标，从 0 开始
     */
    size_t test_case_index = 0;

    std::string description;

    status verdict = status::SETUP_ERROR;

    /**
     * @brief 去掉首尾空白字符的选手输出
     */
    std::string output;

    std::string expected;

    /**
     * @brief 运行的时钟时间，单位为秒
     */
    double execution_time = 0;

    /**
     * @brief 错误信息，比如编译错误、标准错误输出或者评测系统内部错误的提示
     */
    std::string error;

    int exit_code = 0;

    bool is_hidden = false;

    /**
     * @brief 本测试点是否真正运行了选手程序且没有超时，只有这样的测试点计入时间统计
     */
    bool measured() const;
};

/**
 * @brief 运行时间统计，单位为秒
 */
struct performance_summary {
    double min_time = 0;
    double avg_time = 0;
    double max_time = 0;

    /**
     * @brief 参与统计的测试点个数
     */
    size_t measured_count = 0;
};

/**
 * @brief 一个提交的评测报告
 */
struct judge_report {
    std::vector<test_result> results;

    size_t passed = 0;
    size_t total = 0;

    /**
     * @brief 100 * passed / total，范围为 [0, 100]
     */
    double correctness_score = 0;

    performance_summary performance;

    final_verdict verdict = final_verdict::FAILED;

    /**
     * @brief 语言标识，已经解析过别名
     */
    std::string language;

    std::string problem_id;

    /**
     * @brief 共享编译的编译器输出
     */
    std::string compilation_log;

    /**
     * @brief 评测整个提交花费的时间，单位为秒
     */
    double judge_time = 0;
};

/**
 * @brief 根据 results 计算通过数、得分、时间统计和最终结论
 */
void summarize(judge_report &report);

/**
 * @brief 将评测报告转换为 json
 * @param reveal_hidden 为假时隐藏测试点不输出 output, expected, error
 */
nlohmann::json to_json(const judge_report &report, bool reveal_hidden);

}  // namespace codejudge

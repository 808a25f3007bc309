#pragma once

#include <cstddef>
#include "judge/harness.hpp"
#include "judge/language.hpp"
#include "judge/report.hpp"
#include "judge/runner.hpp"
#include "judge/submission.hpp"

/**
 * 这个头文件包含编程题评测器
 * 评测流程：
 * 1. 根据提交的语言查找 language_profile，检查提交是否合法；
 * 2. 对于编译型语言，整个提交只编译一次，所有测试点共享编译产物；
 * 3. 每个测试点生成评测单元、运行、判定结果，测试点之间并行评测；
 * 4. 统计通过数、得分、时间，生成评测报告。
 */
namespace codejudge {

struct judge_options {
    /**
     * @brief 并行评测测试点的线程数
     */
    size_t workers = 1;

    /**
     * @brief 编译型语言是否整个提交只编译一次
     * 为假时每个测试点单独编译
     */
    bool share_compilation = true;
};

/**
 * @brief 确定一个测试点生效的时间和内存限制
 * 优先级：提交的 constraints > 测试点自己的限制 > 语言的默认限制
 */
execution_limits resolve_limits(const submission &submit, const test_case &tc, const language_profile &profile);

/**
 * @brief 编程题评测器
 * 每次 judge 调用之间没有共享的可变状态，可以被多个线程同时调用。
 */
struct programming_judger {
    explicit programming_judger(language_registry languages, judge_options options = judge_options());

    /**
     * @brief 评测一个提交
     * 每个测试点都会被评测，不会提前结束；某个测试点评测时出现的内部错误
     * 只会使该测试点的结果为 SETUP_ERROR。
     * @throw unsupported_language 语言表中没有提交的语言，此时不会启动任何进程
     * @throw invalid_submission 提交没有测试点、代码为空，或者限制不是正数
     */
    judge_report judge(const submission &submit) const;

    const language_registry &languages() const;

private:
    language_registry registry;
    judge_options options;
    harness_generator generator;
    process_runner runner;

    /**
     * @brief 评测一个测试点
     * @param program 共享的编译产物，解释型语言或者不共享编译时为空
     * @param setup_failed 共享编译时出现了内部错误，所有测试点均为 SETUP_ERROR
     */
    test_result judge_test_case(const submission &submit, const language_profile &profile, size_t index,
                                const compiled_program *program, bool setup_failed) const;
};

}  // namespace codejudge

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 测试点难度，只用于展示，不影响评测
 */
enum class test_difficulty {
    EASY,
    MEDIUM,
    HARD
};

const char *get_difficulty_name(test_difficulty);

/**
 * @brief 表示一个测试点
 * 评测开始后不再修改
 */
struct test_case {
    /**
     * @brief 喂给选手程序标准输入的数据
     */
    std::string input_data;

    /**
     * @brief 标准输出，比较时忽略首尾空白字符
     */
    std::string expected_output;

    /**
     * @brief 本测试点的时间限制，单位为秒
     * @note 没有给出时使用语言的默认时间限制
     */
    std::optional<double> time_limit_seconds;

    /**
     * @brief 本测试点的内存限制，单位为 MB
     * @note 没有给出时使用语言的默认内存限制
     */
    std::optional<int> memory_limit_mb;

    /**
     * @brief 隐藏测试点照常评测，但是报告中不展示输入输出
     */
    bool is_hidden = false;

    test_difficulty difficulty = test_difficulty::MEDIUM;

    std::string description;
};

/**
 * @brief 对整个提交生效的限制，会覆盖每个测试点自己的限制
 */
struct judge_constraints {
    std::optional<double> time_limit_seconds;
    std::optional<int> memory_limit_mb;
};

/**
 * @brief 一个选手提交
 * 一个提交产生一份评测报告，不同提交之间没有共享的可变状态
 */
struct submission {
    std::string code;

    /**
     * @brief 语言标识或别名，参见 language_registry
     */
    std::string language;

    std::string problem_id;

    /**
     * @brief 测试点，评测结果按照相同的顺序保存
     */
    std::vector<test_case> test_cases;

    judge_constraints constraints;
};

/**
 * @brief 检查提交是否可以评测
 * @throw invalid_submission 没有测试点、代码为空、或者给出的限制不是正数
 */
void verify(const submission &submit);

/**
 * @brief 从 json 中读取测试点
 * input_data 可以是数组，此时每个元素占一行；
 * expected_output 可以是任意值，非字符串会被序列化。
 */
void from_json(const nlohmann::json &j, test_case &tc);

void from_json(const nlohmann::json &j, submission &submit);

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << submit.language << "-" << submit.problem_id << ", " << submit.test_cases.size() << " test cases]";
    return os;
}

}  // namespace codejudge

#pragma once

#include <string>

namespace codejudge {

/**
 * @brief 表示一个测试点的评测结果
 * 每个测试点有且仅有一个评测结果，一旦确定不再修改
 */
enum class status {
    /**
     * @brief 选手程序本测试点评测通过
     * 选手输出与标准输出去掉首尾空白字符后完全一致
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 选手程序正常退出，但输出与标准输出不一致。
     * 只忽略首尾空白字符，中间的空白字符不一致也是 WA。
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 选手程序编译错误
     * 对于每个提交只编译一次的语言，该提交的所有测试点都会是 CE
     */
    COMPILATION_ERROR = 2,

    /**
     * @brief 用户程序出现运行时错误
     * 返回值非零、被信号终止、找不到入口函数，或者在需要输出时没有输出
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 用户程序运行时间超出限制
     * 比较的是时钟时间，超时的进程组会被 SIGKILL 杀死
     */
    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 评测系统内部错误
     * 和选手代码无关，比如文件系统错误、编译器无法启动
     */
    SETUP_ERROR = 5
};

/**
 * @brief 表示整个提交的评测结论
 */
enum class final_verdict {
    ACCEPTED = 0,  // 所有测试点均通过
    PARTIAL = 1,   // 部分测试点通过
    FAILED = 2     // 没有测试点通过
};

/**
 * @brief 获得评测结果的展示名称，如 "Time Limit Exceeded"
 */
const char *get_display_message(status);

/**
 * @brief 获得评测结果的标识名称，如 "TIME_LIMIT_EXCEEDED"
 */
const char *get_status_name(status);

const char *get_final_verdict_name(final_verdict);

}  // namespace codejudge

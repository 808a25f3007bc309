#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "common/io_utils.hpp"
#include "judge/harness.hpp"
#include "judge/language.hpp"

namespace codejudge {

/**
 * @brief 一个测试点生效的限制，已经按照提交、测试点、语言默认值的优先级确定
 */
struct execution_limits {
    /**
     * @brief 时钟时间限制，单位为秒
     */
    double time_limit_seconds;

    /**
     * @brief 内存限制，单位为 MB
     */
    int memory_limit_mb;
};

/**
 * @brief 一次运行的原始结果，交给 verdict_classifier 判定
 */
struct raw_execution_result {
    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 返回值，被信号终止时为 128 + 信号值
     */
    int exit_code = 0;

    int signal = 0;

    /**
     * @brief 运行的时钟时间，单位为秒，不包含编译时间
     */
    double wall_time = 0;

    bool timed_out = false;

    bool output_truncated = false;

    /**
     * @brief 编译失败，此时没有运行选手程序
     */
    bool compile_failed = false;

    std::string compile_log;
};

/**
 * @brief 编译产物
 * 同一个提交的所有测试点共享一个编译产物，编译完成后只读。
 * 析构时删除编译目录。
 */
struct compiled_program {
    /**
     * @brief 编译目录，包含 src 和 bin 两个子目录
     */
    scoped_directory directory;

    /**
     * @brief 编译产物所在的文件夹，对应命令中的 {artifact_dir}
     */
    std::filesystem::path artifact_dir;

    /**
     * @brief 编译产物的路径，对应命令中的 {binary}
     */
    std::filesystem::path binary;

    std::string main_class;

    bool success = false;

    /**
     * @brief 编译器的输出
     */
    std::string compile_log;
};

/**
 * @brief 负责评测单元的编译、运行以及文件系统、进程的生命周期
 * 每次运行都在 RUN_DIR 下一个新的随机命名的目录中进行，返回前删除该目录。
 */
struct process_runner {
    /**
     * @brief 编译评测单元
     * 编译失败不会抛出异常，而是返回 success 为 false 的编译产物
     * @param unit 评测单元，只使用其中的源文件
     * @param profile 语言，必须是编译型语言
     * @throw internal_error 编译器无法启动，或者语言不需要编译
     */
    std::shared_ptr<const compiled_program> compile(const execution_unit &unit, const language_profile &profile) const;

    /**
     * @brief 运行评测单元
     * @param program 已经编译好的程序，对于编译型语言为空时在本次运行中编译
     * @return 编译失败时 compile_failed 为真，不运行程序
     * @throw internal_error 命令无法启动，比如解释器不存在
     */
    raw_execution_result run(const execution_unit &unit, const language_profile &profile, const execution_limits &limits, const compiled_program *program = nullptr) const;
};

}  // namespace codejudge

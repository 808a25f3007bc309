#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 启动子进程的参数
 */
struct process_options {
    /**
     * @brief 要执行的命令，第一个元素在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作路径，为空时继承评测系统的工作路径
     */
    std::filesystem::path work_dir;

    /**
     * @brief 写入子进程标准输入的数据，写完后关闭标准输入
     */
    std::string stdin_data;

    /**
     * @brief 时钟时间限制，单位为秒
     * 超时后整个进程组会被 SIGKILL 杀死
     */
    double timeout_seconds = 1;

    /**
     * @brief 地址空间限制（RLIMIT_AS），单位为字节，小于等于 0 表示不限制
     */
    int64_t memory_limit_bytes = -1;

    /**
     * @brief 是否设置 CPU 时间限制（RLIMIT_CPU）作为时钟时间限制之外的保险
     * CPU 时间限制为 ceil(timeout_seconds) + 1 秒，超过 MAX_CPU_LIMIT 秒时不限制
     */
    bool limit_cpu_time = true;

    /**
     * @brief 每个输出流最多保留多少字节，小于 0 时使用 OUTPUT_LIMIT
     */
    int64_t output_limit = -1;
};

/**
 * @brief RLIMIT_CPU 的上限，单位为秒
 */
const double MAX_CPU_LIMIT = 1e7;

/**
 * @brief 子进程的运行结果
 */
struct process_result {
    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 返回值，被信号终止时为 128 + 信号值
     */
    int exit_code = 0;

    /**
     * @brief 终止子进程的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 子进程运行的时钟时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 子进程消耗的 CPU 时间（用户态加内核态，所有线程之和），单位为秒
     */
    double cpu_time = 0;

    /**
     * @brief 超过时钟时间限制，或者因为 RLIMIT_CPU 被 SIGXCPU/SIGKILL 终止
     */
    bool timed_out = false;

    /**
     * @brief 是否有输出因为超过 output_limit 被丢弃
     */
    bool output_truncated = false;
};

/**
 * @brief 启动子进程并等待其结束
 * 子进程在新的会话（进程组）中运行，结束后该进程组中剩余的进程都会被杀死。
 * 函数返回时子进程已经被回收，所有管道都已关闭。
 * @throw internal_error 命令无法启动，比如编译器不存在
 * @throw std::system_error 系统调用失败
 */
process_result run_process(const process_options &options);

}  // namespace codejudge

#pragma once

#include <cstdint>
#include <filesystem>

namespace codejudge {

/**
 * @brief 编译时间限制，单位为秒
 * 与测试点的时间限制无关，所有提交使用同一个编译时间限制
 */
extern double COMPILE_TIME_LIMIT;

/**
 * @brief 选手程序每个输出流最多保留多少字节，超出部分会被丢弃
 */
extern int64_t OUTPUT_LIMIT;

/**
 * @brief 杀死进程组之后，最多继续读取管道中残留数据的时间，单位为秒
 */
extern double KILL_DELAY;

/**
 * @brief 选手程序编译及运行的根目录
 * 每个评测单元都会在这个目录下创建一个随机命名的子目录，评测完成后删除。
 *
 * RUN_DIR
 * ├── build-[uuid] // 每个提交共享的编译目录（编译型语言）
 * │   ├── src // 源代码
 * │   └── program // 编译产物
 * ├── run-[uuid] // 一个测试点的运行目录，选手程序的工作路径
 * │   └── solution.py // 解释型语言的源代码
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统将不会删除产生的运行目录，
 * 以便手动检查生成的评测代码和编译产物是否符合预期。
 */
extern bool DEBUG;

}  // namespace codejudge

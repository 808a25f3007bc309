#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 描述一种编程语言如何编译、运行
 * 语言表在评测系统启动时加载，之后不再修改。
 *
 * 编译命令和运行命令中可以使用以下占位符：
 * {source}       主源文件的路径
 * {sources}      所有源文件的路径，展开为多个参数
 * {binary}       编译产物的路径
 * {artifact_dir} 编译产物所在的文件夹
 * {work_dir}     本测试点的运行目录
 * {main_class}   主类名，对于 Java 是入口类
 * {memory_mb}    内存限制，单位为 MB
 */
struct language_profile {
    /**
     * @brief 语言标识，如 python, c, c++, java, javascript
     */
    std::string id;

    /**
     * @brief 语言的别名，如 c++ 的 cpp，查找语言时不区分大小写
     */
    std::vector<std::string> aliases;

    /**
     * @brief 源文件扩展名，包含 "."
     */
    std::string source_extension;

    /**
     * @brief 编译命令，为空表示该语言不需要编译
     * @code{.json}
     * ["g++", "-O2", "-o", "{binary}", "{sources}"]
     * @endcode
     */
    std::vector<std::string> compile_command;

    /**
     * @brief 运行命令
     * @code{.json}
     * ["python3", "{source}"]
     * @endcode
     */
    std::vector<std::string> run_command;

    /**
     * @brief 测试点没有指定时间限制时使用的时间限制
     * @note 单位为秒
     */
    double default_timeout_seconds = 2;

    /**
     * @brief 测试点没有指定内存限制时使用的内存限制
     * @note 单位为 MB
     */
    int default_memory_limit_mb = 256;

    /**
     * @brief 是否通过 RLIMIT_AS 限制地址空间
     * Java, JavaScript 这类有 GC 的语言启动时会申请很大的虚拟地址空间，
     * 限制地址空间会导致虚拟机无法启动，因此对这些语言关闭，
     * 由虚拟机自身的参数（如 -Xmx{memory_mb}m）限制内存。
     */
    bool limit_address_space = true;

    /**
     * @brief 生成评测代码使用的策略名，参见 harness_generator
     */
    std::string harness;

    bool compiled() const;
};

void from_json(const nlohmann::json &j, language_profile &profile);

/**
 * @brief 语言表
 * 根据语言标识查找 language_profile，可以通过 json 配置文件扩展或者覆盖内置的语言。
 */
struct language_registry {
    /**
     * @brief 包含 python, c, c++, java, javascript 的内置语言表
     */
    static language_registry builtin();

    /**
     * @brief 添加一种语言，已存在相同 id 的语言时覆盖
     */
    void add(const language_profile &profile);

    /**
     * @brief 从 json 中加载语言
     * @code{.json}
     * {"languages": [{"id": "ruby", "source_extension": ".rb", "run_command": ["ruby", "{source}"], "harness": "..."}]}
     * @endcode
     */
    void load(const nlohmann::json &j);

    void load(const std::filesystem::path &file);

    /**
     * @brief 根据语言标识或者别名查找语言
     * @throw unsupported_language 语言表中没有该语言
     */
    const language_profile &resolve(const std::string &language) const;

    std::vector<std::string> languages() const;

private:
    std::map<std::string, language_profile> profiles;

    // 小写的语言标识或别名到语言标识的映射
    std::map<std::string, std::string> index;
};

}  // namespace codejudge

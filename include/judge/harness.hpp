#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "judge/language.hpp"
#include "judge/submission.hpp"

/**
 * 这个头文件包含生成评测代码的类
 * 选手只提交一个函数（或者一个类），评测系统需要找到选手代码的入口，
 * 生成一段调用入口的代码：从标准输入读取测试数据，转换为函数参数，
 * 调用入口函数之后将返回值输出到标准输出。
 *
 * 每种语言寻找入口、生成代码的方式不同，因此每种语言对应一个 language_harness，
 * 由 language_profile::harness 选择。
 */
namespace codejudge {

/**
 * @brief 函数的一个形式参数
 */
struct parameter {
    /**
     * @brief 参数类型，已经去掉了 const、& 等修饰，如 "int", "std::vector<int>", "char*"
     */
    std::string type;

    std::string name;
};

/**
 * @brief 选手代码的入口
 */
struct entry_point {
    enum class entry_kind {
        FUNCTION,  // 顶层函数
        METHOD,    // 类的成员函数，需要先构造一个对象
        PROGRAM    // 选手提交的是完整程序，比如定义了 main 函数
    };

    entry_kind kind = entry_kind::FUNCTION;

    /**
     * @brief 函数名，对于 PROGRAM 是 "main"
     */
    std::string name;

    /**
     * @brief 函数所属的类名，对于 Java 是入口类
     */
    std::string owner;

    std::string return_type;

    /**
     * @brief 形式参数，只有静态类型的语言需要，动态语言在运行时检查参数个数
     */
    std::vector<parameter> parameters;
};

/**
 * @brief 需要写入运行目录的一个源文件
 */
struct source_file {
    std::string name;
    std::string content;
};

/**
 * @brief 一个测试点的评测单元
 * 由 harness_generator 生成，交给 process_runner 写入磁盘并运行，运行结束后丢弃。
 */
struct execution_unit {
    /**
     * @brief 所有需要写入运行目录的源文件，至少包含 main_file
     */
    std::vector<source_file> files;

    /**
     * @brief 主源文件名，对应命令中的 {source}
     */
    std::string main_file;

    /**
     * @brief 主类名，对应命令中的 {main_class}
     */
    std::string main_class;

    /**
     * @brief 喂给选手程序标准输入的数据
     */
    std::string stdin_data;

    /**
     * @brief 找到的入口，找不到时为空，此时生成的代码在运行时报错退出
     */
    std::optional<entry_point> entry;
};

/**
 * @brief 一种语言寻找入口、生成评测代码的策略
 * 生成评测代码的过程不会执行选手代码。
 */
struct language_harness {
    virtual ~language_harness();

    /**
     * @brief 在选手代码中寻找入口
     * @return 找不到入口时返回空
     */
    virtual std::optional<entry_point> find_entry_point(const std::string &code) const = 0;

    /**
     * @brief 生成评测代码
     * 评测代码在运行时从标准输入读取测试数据，因此同一个提交的所有测试点生成的源文件相同，
     * 编译型语言可以只编译一次。
     * @param code 选手代码
     * @param entry 找到的入口，为空时生成的代码运行时向标准错误输出报错信息并以非零返回值退出
     * @param profile 语言，提供源文件扩展名
     */
    virtual execution_unit wrap(const std::string &code, const std::optional<entry_point> &entry, const language_profile &profile) const = 0;
};

struct python_harness : language_harness {
    std::optional<entry_point> find_entry_point(const std::string &code) const override;
    execution_unit wrap(const std::string &code, const std::optional<entry_point> &entry, const language_profile &profile) const override;
};

struct javascript_harness : language_harness {
    std::optional<entry_point> find_entry_point(const std::string &code) const override;
    execution_unit wrap(const std::string &code, const std::optional<entry_point> &entry, const language_profile &profile) const override;
};

/**
 * @brief C 和 C++ 的评测代码生成
 * 选手代码定义了 main 函数时直接运行；否则生成一个 main 函数，
 * 按照参数类型从标准输入读取参数。
 */
struct c_family_harness : language_harness {
    /**
     * @param cpp 为真时生成 C++ 代码，允许类的成员函数作为入口
     */
    explicit c_family_harness(bool cpp);

    std::optional<entry_point> find_entry_point(const std::string &code) const override;
    execution_unit wrap(const std::string &code, const std::optional<entry_point> &entry, const language_profile &profile) const override;

private:
    bool cpp;

    std::string generate_c_main(const entry_point &entry) const;
    std::string generate_cpp_main(const entry_point &entry) const;
};

/**
 * @brief Java 的评测代码生成
 * 源文件名必须和 public 类名一致，入口方法通过反射调用。
 */
struct java_harness : language_harness {
    std::optional<entry_point> find_entry_point(const std::string &code) const override;
    execution_unit wrap(const std::string &code, const std::optional<entry_point> &entry, const language_profile &profile) const override;
};

/**
 * @brief 根据语言选择 language_harness 生成评测单元
 */
struct harness_generator {
    /**
     * @brief 注册 python, javascript, c, cpp, java 策略
     */
    harness_generator();

    void register_harness(const std::string &name, std::unique_ptr<language_harness> &&harness);

    /**
     * @throw internal_error 没有名为 name 的策略
     */
    const language_harness &get(const std::string &name) const;

    /**
     * @brief 生成一个测试点的评测单元
     * @param code 选手代码
     * @param profile 选手代码的语言
     * @param tc 测试点，输入数据作为评测单元的标准输入
     */
    execution_unit build(const std::string &code, const language_profile &profile, const test_case &tc) const;

private:
    std::map<std::string, std::unique_ptr<language_harness>> harnesses;
};

/**
 * @brief 将 C 风格代码中的注释、字符串和字符字面量替换为空格，保留换行
 * 用于在 C, C++, Java 代码中寻找声明，替换后各字符的位置不变。
 * @param strip_preprocessor 为真时同时去掉预处理指令行
 */
std::string blank_comments_and_literals(const std::string &code, bool strip_preprocessor);

/**
 * @brief 同一层作用域中的一条声明
 */
struct scope_segment {
    std::string header;  // 从上一条声明结束到 '{' 或 ';' 之间的文本
    char terminator;     // '{' 或 ';'
    size_t body_begin, body_end;  // terminator 为 '{' 时花括号内的范围
};

/**
 * @brief 将 [begin, end) 内的代码按照同一层的 ';' 和花括号块切分
 * @param text 已经经过 blank_comments_and_literals 处理的代码
 */
std::vector<scope_segment> split_scope(const std::string &text, size_t begin, size_t end);

/**
 * @brief 将字符串转换为目标语言的字符串字面量
 */
std::string quote_string(const std::string &str);

}  // namespace codejudge

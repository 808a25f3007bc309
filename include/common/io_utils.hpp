#pragma once

#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw std::system_error 文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 是一个不会跳出所在目录的相对文件名
 * 生成的源文件名来自选手代码中的类名，如果拿到的文件名包含 "../"
 * 或者是绝对路径，那么写文件时可能覆盖运行目录之外的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 去掉目录下所有文件的写权限
 * 编译产物会被同一提交的多个测试点并发读取，编译完成后不允许再被修改
 */
void make_read_only(const std::filesystem::path &dir);

/**
 * @brief 作用域内独占的临时文件夹
 * 文件夹名为 prefix 加上随机 UUID，不可预测且不会和其他评测单元冲突。
 * 析构时递归删除（DEBUG 模式下保留）。
 */
struct scoped_directory {
    scoped_directory();

    /**
     * @brief 在 parent 下创建一个新的文件夹
     * @param parent 父目录，不存在时自动创建
     * @param prefix 文件夹名前缀，如 "run-"
     */
    scoped_directory(const std::filesystem::path &parent, const std::string &prefix);
    scoped_directory(scoped_directory &&);
    scoped_directory(const scoped_directory &) = delete;
    ~scoped_directory();

    scoped_directory &operator=(scoped_directory &&);
    scoped_directory &operator=(const scoped_directory &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 立即删除文件夹，之后 path() 为空
     */
    void release();

private:
    std::filesystem::path dir;
};

}  // namespace codejudge

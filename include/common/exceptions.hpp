#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace codejudge {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是文件系统出错、编译器或解释器无法启动、生成评测代码失败等，
 * 与选手代码无关。对应测试点的评测结果为 SETUP_ERROR。
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示提交使用的语言不在语言表中
 * 该错误发生在任何进程启动之前，整个提交的评测失败
 */
struct unsupported_language : public judge_exception {
    const std::string language;

    explicit unsupported_language(const std::string &language);
};

/**
 * @brief 表示提交本身不合法，比如没有测试点或者时间限制不是正数
 */
struct invalid_submission : public judge_exception {
    explicit invalid_submission(const std::string &message);
};

}  // namespace codejudge

#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sortbot {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    template <typename T>
    judge_exception operator<<(const T &t) const {
        return judge_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是评测引擎自身的不变量被破坏，比如某个测试点没有产生结果
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示评测资源错误
 * 比如无法创建临时文件、管道，或者无法启动 harness 进程。
 * 这类错误只影响当前测试点，会被转换为 ERROR 结果
 */
struct resource_error : public judge_exception {
    resource_error();
    explicit resource_error(const std::string &message);
};

/**
 * @brief 表示存储层错误
 * 读写提交或评测结果失败，这是唯一会中止整个提交评测的错误，
 * 提交会被标记为 FAILED
 */
struct store_error : public judge_exception {
    store_error();
    explicit store_error(const std::string &message);
};

}  // namespace sortbot

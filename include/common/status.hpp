#pragma once

#include <string>

namespace sortbot {

/**
 * @brief 表示一个测试点的评测结果
 */
enum class outcome {
    /**
     * @brief 选手程序返回了与标准输出逐值相等的结果
     */
    PASS = 0,

    /**
     * @brief 选手程序正常返回，但结果与标准输出不一致
     */
    FAIL = 1,

    /**
     * @brief 选手程序抛出异常、无法编译、找不到排序函数，
     * 或者 harness 的输出无法解析（比如进程崩溃、评测资源错误）
     */
    ERROR = 2,

    /**
     * @brief 选手程序运行时间超过了时钟时间限制，进程组已被杀死
     */
    TIMEOUT = 3
};

/**
 * @brief 表示整个提交的评测状态
 * 客户端通过轮询该状态得知评测进度，该状态只会按
 * PENDING -> RUNNING -> COMPLETED/FAILED 的顺序变化
 */
enum class submission_status {
    /**
     * @brief 提交正在等待队列中，还未开始评测
     */
    PENDING = 0,

    /**
     * @brief 提交正在评测
     */
    RUNNING = 1,

    /**
     * @brief 所有测试点都已产生结果，且分数已经保存
     */
    COMPLETED = 2,

    /**
     * @brief 存储层出错导致评测中止
     */
    FAILED = 3
};

const char *get_display_message(outcome);

const char *get_display_message(submission_status);

/**
 * @brief 存储层使用的小写名称，如 pass、fail、error、timeout
 */
const char *get_status_name(outcome);

const char *get_status_name(submission_status);

/**
 * @brief 将存储层的小写名称转换回评测结果
 * @throw std::invalid_argument 如果名称无法识别
 */
outcome parse_outcome(const std::string &name);

submission_status parse_submission_status(const std::string &name);

/**
 * @brief 提交是否已经处于终止状态（COMPLETED 或 FAILED）
 */
bool is_terminal(submission_status);

}  // namespace sortbot

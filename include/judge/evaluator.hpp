#pragma once

#include <cstddef>
#include "judge/sandbox.hpp"
#include "judge/submission.hpp"

namespace sortbot {

/**
 * @brief 评测引擎的配置
 * 评测过程中不会读取全局配置，全局配置在构造 evaluator 时通过 from_globals 快照下来
 */
struct evaluator_config {
    /**
     * @brief 每个测试点的时钟时间限制，单位为秒
     */
    double timeout = 30;

    /**
     * @brief 同一个提交最多同时评测多少个测试点
     */
    std::size_t workers = 1;

    sandbox::sandbox_options sandbox;

    /**
     * @brief 从 config.hpp 中的全局配置生成评测引擎配置
     */
    static evaluator_config from_globals();
};

/**
 * @brief 评测引擎
 * 对一个提交的每个测试点生成 harness、在沙箱中运行并解析结果，最后计算总分。
 * evaluator 本身没有可变状态，可以被多个线程同时调用 evaluate。
 */
struct evaluator {
    explicit evaluator(const evaluator_config &config);

    /**
     * @brief 评测一个提交
     * 每个测试点恰好产生一个结果，顺序与 request.test_cases 一致。
     * 单个测试点的评测资源错误会被转换为 ERROR 结果，不会中止整个提交的评测。
     * @param request 评测请求
     * @return 评测结果，状态为 COMPLETED
     * @throw internal_error 如果某个测试点没有产生结果
     */
    submission_result evaluate(const evaluation_request &request) const;

    /**
     * @brief 评测一个测试点
     * 生成 harness、在沙箱中运行并解析结果。过程中的任何 std::exception 都会被转换为 ERROR 结果。
     */
    test_outcome evaluate_test_case(const std::string &code, const test_case &tc) const;

    const evaluator_config &config() const;

private:
    evaluator_config conf;
};

}  // namespace sortbot

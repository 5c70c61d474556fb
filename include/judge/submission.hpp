#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

/**
 * 这个头文件包含评测引擎的数据模型
 * 包含：
 * 1. test_case 类（表示一个测试点）
 * 2. evaluation_request 类（表示一次评测请求）
 * 3. test_outcome 类（表示一个测试点的评测结果）
 * 4. submission_result 类（表示整个提交的评测结果）
 */
namespace sortbot {

/**
 * @brief 表示一个测试点
 * 测试点由存储层创建，创建后不可修改
 */
struct test_case {
    /**
     * @brief 测试点 id，由存储层分配
     */
    int id = 0;

    /**
     * @brief 测试点的识别名，如 "Small Reverse Array"
     */
    std::string name;

    /**
     * @brief 数据规模分类，如 small、medium、large
     * 排行榜可以按这个分类筛选
     */
    std::string size_category;

    /**
     * @brief 数据特征，如 best_case、worst_case、random
     */
    std::string difficulty;

    /**
     * @brief 交给选手排序函数的输入数组
     */
    std::vector<std::int64_t> data;

    /**
     * @brief 标准输出，选手的返回值必须与其逐值相等
     */
    std::vector<std::int64_t> expected;
};

/**
 * @brief 一次评测请求，对应一个提交
 * 评测引擎只读取该结构体，不会修改
 */
struct evaluation_request {
    /**
     * @brief 提交 id
     * string 可以兼容一切情况
     */
    std::string sub_id;

    /**
     * @brief 选手提交的 Python 代码
     */
    std::string code;

    /**
     * @brief 按顺序评测的测试点
     */
    std::vector<test_case> test_cases;
};

/**
 * @brief 一个测试点的评测结果
 * 每个 (提交, 测试点) 恰好产生一个结果
 */
struct test_outcome {
    /**
     * @brief 对应的测试点 id
     */
    int test_case_id = 0;

    outcome kind = outcome::ERROR;

    /**
     * @brief 选手排序函数的运行用时
     * 单位为秒，非负。
     * 对于 TIMEOUT，是配置的时间限制；
     * 若 harness 没有报告用时，则为整个进程的时钟时间
     */
    double run_time = 0;

    /**
     * @brief 诊断信息
     * PASS 没有诊断信息；FAIL 一般为 "Result mismatch"；
     * ERROR 为选手程序抛出的异常信息或者 harness 的 stderr
     */
    std::optional<std::string> message;
};

bool operator==(const test_outcome &a, const test_outcome &b);
bool operator!=(const test_outcome &a, const test_outcome &b);

/**
 * @brief 整个提交的评测结果
 * 只在所有测试点评测完成后才会构造，不存在部分可见的结果
 */
struct submission_result {
    std::string sub_id;

    /**
     * @brief 与 evaluation_request::test_cases 一一对应的评测结果
     */
    std::vector<test_outcome> outcomes;

    /**
     * @brief 总分，是所有 PASS 测试点用时的算术平均值，越小越好
     * 没有任何 PASS 测试点时为 0
     */
    double score = 0;

    submission_status status = submission_status::COMPLETED;

    /**
     * @brief 统计某种评测结果的测试点数量
     */
    std::size_t count(outcome kind) const;
};

/**
 * @brief 计算总分
 * 是 outcomes 的纯函数：PASS 测试点用时的算术平均值，没有 PASS 时为 0
 */
double aggregate_score(const std::vector<test_outcome> &outcomes);

void to_json(nlohmann::json &j, const test_case &value);
void from_json(const nlohmann::json &j, test_case &value);

void to_json(nlohmann::json &j, const test_outcome &value);
void from_json(const nlohmann::json &j, test_outcome &value);

void to_json(nlohmann::json &j, const submission_result &value);

template <typename T>
T &operator<<(T &os, const evaluation_request &request) {
    os << "Submission[" << request.sub_id << ", " << request.test_cases.size() << " test cases]";
    return os;
}

}  // namespace sortbot

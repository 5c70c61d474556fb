#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/submission.hpp"

namespace sortbot::server {

/**
 * @brief 提交所属的排序机器人
 */
struct bot_info {
    std::string id;
    std::string name;

    /**
     * @brief 机器人使用的算法，如 quick_sort、bubble_sort，排行榜可以按算法筛选
     */
    std::string algorithm;

    std::string author;
};

/**
 * @brief 存储层保存的一个提交
 */
struct submission_record {
    std::string sub_id;
    bot_info bot;
    std::string code;

    /**
     * @brief 提交时间，自 UNIX 纪元起的毫秒数
     */
    std::int64_t submitted_at = 0;

    submission_status status = submission_status::PENDING;

    /**
     * @brief 开始评测时确定的测试点 id 列表
     * 只有这些测试点可以记录评测结果
     */
    std::vector<int> test_case_ids;

    std::vector<test_outcome> outcomes;

    /**
     * @brief 总分，只有 COMPLETED 的提交才有
     */
    std::optional<double> score;

    /**
     * @brief FAILED 的原因
     */
    std::optional<std::string> error;
};

void to_json(nlohmann::json &j, const bot_info &value);
void from_json(const nlohmann::json &j, bot_info &value);

void to_json(nlohmann::json &j, const submission_record &value);
void from_json(const nlohmann::json &j, submission_record &value);

/**
 * @brief 创建一个新的 PENDING 提交，分配随机 id 并记录当前时间
 */
submission_record make_submission(const bot_info &bot, const std::string &code);

/**
 * @brief 开始评测提交：PENDING -> RUNNING
 * @throw store_error 如果提交不处于 PENDING 状态
 */
void start_submission(submission_record &record, const std::vector<test_case> &test_cases);

/**
 * @brief 记录一个测试点的评测结果
 * @throw store_error 如果提交不在评测中、测试点不属于该提交，或者该测试点已经有结果
 */
void append_outcome(submission_record &record, const test_outcome &result);

/**
 * @brief 保存总分并将提交标记为 COMPLETED
 * @throw store_error 如果提交不在评测中，或者还有测试点没有结果
 */
void complete_submission(submission_record &record, const submission_result &result);

/**
 * @brief 将提交标记为 FAILED
 * @throw store_error 如果提交已经处于终止状态
 */
void fail_submission(submission_record &record, const std::string &reason);

/**
 * @brief 轮询接口可见的评测结果，提交处于终止状态之前为空
 */
std::vector<test_outcome> visible_results(const submission_record &record);

/**
 * @brief 表示一个保存提交和评测结果的存储
 * 运行时可以注册多个存储，worker 轮流从中拉取提交
 */
struct result_store {
    virtual ~result_store();

    /**
     * @brief 存储的 id，用于日志中标记提交来自哪个存储
     */
    virtual std::string category() const = 0;

    /**
     * @brief 通过配置文件打开存储
     * @param config_path 配置文件路径，配置文件为 JSON 格式
     */
    virtual void init(const std::filesystem::path &config_path) = 0;

    /**
     * @brief 添加一个测试点
     * @return 存储分配的测试点 id
     */
    virtual int add_test_case(const test_case &tc) = 0;

    /**
     * @brief 获取所有测试点，按 id 排序
     */
    virtual std::vector<test_case> get_test_cases() const = 0;

    /**
     * @brief 添加一个 PENDING 状态的提交
     * @return 提交 id
     */
    virtual std::string submit(const bot_info &bot, const std::string &code) = 0;

    /**
     * @brief 获取最早的一个 PENDING 提交，并将其标记为 RUNNING
     * @param request 存储该提交的代码和所有测试点
     * @return 是否获取到提交，没有获取到时调用方应该 sleep(10ms)
     */
    virtual bool fetch_submission(evaluation_request &request) = 0;

    /**
     * @brief 记录一个测试点的评测结果
     * 同一个 (提交, 测试点) 只能记录一次
     * @throw store_error 如果写入失败或者结果重复
     */
    virtual void record_outcome(const std::string &sub_id, const test_outcome &result) = 0;

    /**
     * @brief 保存总分并将提交标记为 COMPLETED
     * 调用方必须先通过 record_outcome 记录所有测试点的结果
     * @throw store_error 如果写入失败
     */
    virtual void summarize(const std::string &sub_id, const submission_result &result) = 0;

    /**
     * @brief 将提交标记为 FAILED
     * @param reason 失败原因
     */
    virtual void summarize_failed(const std::string &sub_id, const std::string &reason) = 0;

    /**
     * @throw store_error 如果提交不存在
     */
    virtual submission_status get_status(const std::string &sub_id) const = 0;

    /**
     * @brief 获取提交的评测结果，提交处于终止状态之前为空
     * @throw store_error 如果提交不存在
     */
    virtual std::vector<test_outcome> get_results(const std::string &sub_id) const = 0;

    /**
     * @brief 获取提交的完整记录，包括代码、机器人信息和所有已经记录的结果
     * @throw store_error 如果提交不存在
     */
    virtual submission_record get_submission(const std::string &sub_id) const = 0;

    /**
     * @brief 获取所有提交，用于计算排行榜
     */
    virtual std::vector<submission_record> list_submissions() const = 0;
};

}  // namespace sortbot::server

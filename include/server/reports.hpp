#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "server/store.hpp"

/**
 * 命令行查询使用的报表
 * 存储层只保存提交，机器人、测试点列表等视图都从提交和测试点中计算出来
 */
namespace sortbot::server {

/**
 * @brief 一个机器人的汇总信息
 */
struct bot_summary {
    bot_info bot;

    /**
     * @brief 第一次提交的时间，作为机器人的创建时间
     */
    std::int64_t created_at = 0;

    std::size_t submission_count = 0;

    std::string latest_sub_id;

    /**
     * @brief 最近一次提交的代码，重新提交时使用
     */
    std::string latest_code;
};

/**
 * @brief 不包含代码
 */
void to_json(nlohmann::json &j, const bot_summary &value);

/**
 * @brief 提交的详细报告
 * 包括机器人信息、状态、总分、失败原因，以及带测试点名称和规模分类的评测结果。
 * 评测结果只在提交处于终止状态后可见
 */
nlohmann::json submission_report(const submission_record &record, const std::vector<test_case> &test_cases);

/**
 * @brief 按第一次提交的顺序列出所有机器人，机器人以 bot.id 区分
 * @param offset 跳过的机器人数量
 * @param limit 最多返回的机器人数量
 */
std::vector<bot_summary> list_bots(const std::vector<submission_record> &submissions,
                                   std::size_t offset = 0, std::size_t limit = SIZE_MAX);

std::optional<bot_summary> find_bot(const std::vector<submission_record> &submissions, const std::string &bot_id);

/**
 * @brief 测试点列表，只包含数组长度，不包含数据
 */
nlohmann::json test_case_list(const std::vector<test_case> &test_cases);

/**
 * @brief 为没有测试点的存储添加测试点
 * @return 添加的测试点数量，存储已经有测试点时为 0
 */
std::size_t seed_store(result_store &store, const std::vector<test_case> &battery);

}  // namespace sortbot::server

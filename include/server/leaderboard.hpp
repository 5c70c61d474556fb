#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "server/store.hpp"

namespace sortbot::server {

struct leaderboard_filter {
    /**
     * @brief 只保留在该规模分类的测试点上至少通过一个的提交
     */
    std::optional<std::string> size_category;

    /**
     * @brief 只保留使用该算法的机器人
     */
    std::optional<std::string> algorithm;

    std::size_t limit = 50;
    std::size_t offset = 0;
};

struct leaderboard_entry {
    /**
     * @brief 排名，从 offset + 1 开始
     */
    std::size_t rank = 0;
    std::string bot_name;
    std::string bot_id;
    std::string algorithm;
    std::string author;
    double total_score = 0;
    std::string submission_id;
    std::int64_t submitted_at = 0;
};

void to_json(nlohmann::json &j, const leaderboard_entry &value);

/**
 * @brief 计算排行榜
 * 只统计 COMPLETED 且有总分的提交，按总分从小到大排序，总分相同时先提交的在前
 * @param submissions 所有提交
 * @param test_cases 所有测试点，用于按规模分类筛选
 * @param filter 筛选和分页条件
 */
std::vector<leaderboard_entry> rank(const std::vector<submission_record> &submissions,
                                    const std::vector<test_case> &test_cases,
                                    const leaderboard_filter &filter);

}  // namespace sortbot::server

#pragma once

#include <deque>
#include <map>
#include <mutex>
#include "server/store.hpp"

namespace sortbot::server {

/**
 * @brief 保存在内存中的存储
 * 用于单元测试以及嵌入到其他程序中使用，所有函数都是线程安全的
 */
struct memory_store : public result_store {
    explicit memory_store(const std::string &category_name = "memory");

    std::string category() const override;

    /**
     * @brief 从配置文件中读取存储名和初始测试点
     * 配置文件格式：{"type": "memory", "category": "...", "test_cases": [...]}
     */
    void init(const std::filesystem::path &config_path) override;

    int add_test_case(const test_case &tc) override;

    std::vector<test_case> get_test_cases() const override;

    std::string submit(const bot_info &bot, const std::string &code) override;

    bool fetch_submission(evaluation_request &request) override;

    void record_outcome(const std::string &sub_id, const test_outcome &result) override;

    void summarize(const std::string &sub_id, const submission_result &result) override;

    void summarize_failed(const std::string &sub_id, const std::string &reason) override;

    submission_status get_status(const std::string &sub_id) const override;

    std::vector<test_outcome> get_results(const std::string &sub_id) const override;

    std::vector<submission_record> list_submissions() const override;

    submission_record get_submission(const std::string &sub_id) const override;

private:
    submission_record &find(const std::string &sub_id);
    const submission_record &find(const std::string &sub_id) const;

    std::string category_name;
    mutable std::mutex mut;
    int next_test_case_id = 1;
    std::map<int, test_case> test_cases;
    std::map<std::string, submission_record> submissions;
    // 按提交顺序排列的 PENDING 提交
    std::deque<std::string> pending;
};

}  // namespace sortbot::server

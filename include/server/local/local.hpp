#pragma once

#include <mutex>
#include "server/store.hpp"

/**
 * 本地文件夹存储
 * 文件夹结构：
 * root
 * ├── .lock                // 文件锁，多个评测进程可以共享同一个文件夹
 * ├── test_cases.json      // 所有测试点
 * ├── submissions
 * │   ├── <sub_id>.json    // 提交信息、状态、评测结果和总分
 * │   └── ...
 * └── pending
 *     ├── <sub_id>         // PENDING 提交的索引，内容为提交时间
 *     └── ...
 */
namespace sortbot::server::local {

struct configuration : public result_store {
    std::string category_name;

    /**
     * @brief 存储的根目录
     */
    std::filesystem::path root;

    configuration();

    std::string category() const override;

    /**
     * @brief 读取配置文件并打开存储
     * 配置文件格式：{"type": "local", "category": "...", "root": "..."}
     * root 为相对路径时，相对于配置文件所在的文件夹
     */
    void init(const std::filesystem::path &config_path) override;

    /**
     * @brief 直接打开一个存储文件夹，文件夹不存在时会被创建
     * pending 索引文件夹不存在时，扫描所有提交重建索引
     */
    void open(const std::string &category, const std::filesystem::path &root);

    int add_test_case(const test_case &tc) override;

    std::vector<test_case> get_test_cases() const override;

    std::string submit(const bot_info &bot, const std::string &code) override;

    bool fetch_submission(evaluation_request &request) override;

    void record_outcome(const std::string &sub_id, const test_outcome &result) override;

    void summarize(const std::string &sub_id, const submission_result &result) override;

    void summarize_failed(const std::string &sub_id, const std::string &reason) override;

    submission_status get_status(const std::string &sub_id) const override;

    std::vector<test_outcome> get_results(const std::string &sub_id) const override;

    submission_record get_submission(const std::string &sub_id) const override;

    std::vector<submission_record> list_submissions() const override;

private:
    std::filesystem::path test_cases_path() const;
    std::filesystem::path submission_path(const std::string &sub_id) const;
    std::filesystem::path pending_path(const std::string &sub_id) const;

    std::vector<test_case> load_test_cases() const;
    submission_record load_submission(const std::string &sub_id) const;
    std::vector<submission_record> load_submissions() const;
    void save_submission(const submission_record &record) const;

    void mark_pending(const submission_record &record) const;
    void unmark_pending(const std::string &sub_id) const;
    void rebuild_pending_index() const;

    /**
     * @brief 按 (提交时间, id) 排序的 PENDING 索引
     */
    std::vector<std::pair<std::int64_t, std::string>> load_pending_index() const;

    /**
     * @brief 持有进程内互斥锁和文件夹的文件锁执行 func
     * func 抛出的非 store_error 异常会被转换为 store_error
     */
    template <typename Func>
    auto locked(Func &&func) const;

    mutable std::mutex mut;
};

}  // namespace sortbot::server::local

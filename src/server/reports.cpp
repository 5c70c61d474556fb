#include "server/reports.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <map>

namespace sortbot::server {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const bot_summary &value) {
    j = {{"id", value.bot.id},
         {"name", value.bot.name},
         {"algorithm", value.bot.algorithm},
         {"author", value.bot.author},
         {"created_at", value.created_at},
         {"submissions", value.submission_count},
         {"latest_submission_id", value.latest_sub_id}};
}

json submission_report(const submission_record &record, const vector<test_case> &test_cases) {
    map<int, const test_case *> cases;
    for (auto &tc : test_cases) cases[tc.id] = &tc;

    json results = json::array();
    for (auto &result : visible_results(record)) {
        json row = result;
        auto it = cases.find(result.test_case_id);
        // 测试点被删除后结果依然保留，名称和分类为空
        row["test_case_name"] = it == cases.end() ? json() : json(it->second->name);
        row["size_category"] = it == cases.end() ? json() : json(it->second->size_category);
        results.push_back(move(row));
    }

    return {{"sub_id", record.sub_id},
            {"bot_id", record.bot.id},
            {"bot_name", record.bot.name},
            {"bot", record.bot},
            {"submitted_at", record.submitted_at},
            {"status", get_status_name(record.status)},
            {"total_score", record.score ? json(*record.score) : json()},
            {"error", record.error ? json(*record.error) : json()},
            {"results", results}};
}

vector<bot_summary> list_bots(const vector<submission_record> &submissions, size_t offset, size_t limit) {
    vector<const submission_record *> ordered;
    for (auto &record : submissions) ordered.push_back(&record);
    stable_sort(ordered.begin(), ordered.end(), [](const submission_record *a, const submission_record *b) {
        return a->submitted_at < b->submitted_at;
    });

    vector<bot_summary> bots;
    map<string, size_t> index;
    for (auto record : ordered) {
        auto [it, inserted] = index.emplace(record->bot.id, bots.size());
        if (inserted) {
            bots.emplace_back();
            bots.back().created_at = record->submitted_at;
        }
        bot_summary &summary = bots[it->second];
        // 机器人信息以最近一次提交为准
        summary.bot = record->bot;
        summary.latest_sub_id = record->sub_id;
        summary.latest_code = record->code;
        ++summary.submission_count;
    }

    if (offset >= bots.size()) return {};
    bots.erase(bots.begin(), bots.begin() + offset);
    if (bots.size() > limit) bots.resize(limit);
    return bots;
}

optional<bot_summary> find_bot(const vector<submission_record> &submissions, const string &bot_id) {
    for (auto &summary : list_bots(submissions))
        if (summary.bot.id == bot_id) return summary;
    return nullopt;
}

json test_case_list(const vector<test_case> &test_cases) {
    json list = json::array();
    for (auto &tc : test_cases) {
        list.push_back({{"id", tc.id},
                        {"name", tc.name},
                        {"size_category", tc.size_category},
                        {"difficulty", tc.difficulty},
                        {"data_length", tc.data.size()}});
    }
    return list;
}

size_t seed_store(result_store &store, const vector<test_case> &battery) {
    if (!store.get_test_cases().empty()) {
        LOG(INFO) << "Store " << store.category() << " already has test cases, skipping";
        return 0;
    }
    for (auto &tc : battery) store.add_test_case(tc);
    LOG(INFO) << "Added " << battery.size() << " test cases to store " << store.category();
    return battery.size();
}

}  // namespace sortbot::server

#include "server/store.hpp"
#include <algorithm>
#include <chrono>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace sortbot::server {
using namespace std;
using namespace nlohmann;

result_store::~result_store() {}

void to_json(json &j, const bot_info &value) {
    j = {{"id", value.id},
         {"name", value.name},
         {"algorithm", value.algorithm},
         {"author", value.author}};
}

void from_json(const json &j, bot_info &value) {
    assign_optional(j, value.id, "id");
    j.at("name").get_to(value.name);
    assign_optional(j, value.algorithm, "algorithm");
    assign_optional(j, value.author, "author");
}

void to_json(json &j, const submission_record &value) {
    j = {{"sub_id", value.sub_id},
         {"bot", value.bot},
         {"code", value.code},
         {"submitted_at", value.submitted_at},
         {"status", get_status_name(value.status)},
         {"test_case_ids", value.test_case_ids},
         {"results", value.outcomes}};
    if (value.score) j["total_score"] = *value.score;
    if (value.error) j["error"] = *value.error;
}

void from_json(const json &j, submission_record &value) {
    j.at("sub_id").get_to(value.sub_id);
    j.at("bot").get_to(value.bot);
    j.at("code").get_to(value.code);
    j.at("submitted_at").get_to(value.submitted_at);
    value.status = parse_submission_status(get_value<string>(j, "status"));
    assign_optional(j, value.test_case_ids, "test_case_ids");
    assign_optional(j, value.outcomes, "results");
    if (exists(j, "total_score")) value.score = get_value<double>(j, "total_score");
    if (exists(j, "error")) value.error = get_value<string>(j, "error");
}

submission_record make_submission(const bot_info &bot, const string &code) {
    submission_record record;
    record.sub_id = random_uuid();
    record.bot = bot;
    if (record.bot.id.empty()) record.bot.id = random_uuid();
    record.code = code;
    record.submitted_at = chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
    record.status = submission_status::PENDING;
    return record;
}

void start_submission(submission_record &record, const vector<test_case> &test_cases) {
    if (record.status != submission_status::PENDING)
        throw store_error("submission " + record.sub_id + " is " + get_status_name(record.status) + ", not pending");
    record.status = submission_status::RUNNING;
    record.test_case_ids.clear();
    for (auto &tc : test_cases) record.test_case_ids.push_back(tc.id);
    record.outcomes.clear();
}

void append_outcome(submission_record &record, const test_outcome &result) {
    if (record.status != submission_status::RUNNING)
        throw store_error("submission " + record.sub_id + " is " + get_status_name(record.status) + ", not running");
    if (find(record.test_case_ids.begin(), record.test_case_ids.end(), result.test_case_id) == record.test_case_ids.end())
        throw store_error("test case " + to_string(result.test_case_id) + " does not belong to submission " + record.sub_id);
    for (auto &o : record.outcomes)
        if (o.test_case_id == result.test_case_id)
            throw store_error("test case " + to_string(result.test_case_id) + " of submission " + record.sub_id + " already has an outcome");
    record.outcomes.push_back(result);
}

void complete_submission(submission_record &record, const submission_result &result) {
    if (record.status != submission_status::RUNNING)
        throw store_error("submission " + record.sub_id + " is " + get_status_name(record.status) + ", not running");
    // 总分只能在所有测试点都有结果之后提交
    if (record.outcomes.size() != record.test_case_ids.size())
        throw store_error("submission " + record.sub_id + " has " + to_string(record.outcomes.size()) + " outcomes, expected " + to_string(record.test_case_ids.size()));
    record.score = result.score;
    record.status = submission_status::COMPLETED;
}

void fail_submission(submission_record &record, const string &reason) {
    if (is_terminal(record.status))
        throw store_error("submission " + record.sub_id + " is already " + get_status_name(record.status));
    record.status = submission_status::FAILED;
    record.error = reason;
}

vector<test_outcome> visible_results(const submission_record &record) {
    if (!is_terminal(record.status)) return {};
    return record.outcomes;
}

}  // namespace sortbot::server

#include "judge/submission.hpp"
#include <algorithm>
#include "common/json_utils.hpp"

namespace sortbot {
using namespace std;
using namespace nlohmann;

bool operator==(const test_outcome &a, const test_outcome &b) {
    return a.test_case_id == b.test_case_id && a.kind == b.kind &&
           a.run_time == b.run_time && a.message == b.message;
}

bool operator!=(const test_outcome &a, const test_outcome &b) {
    return !(a == b);
}

size_t submission_result::count(outcome kind) const {
    return count_if(outcomes.begin(), outcomes.end(), [kind](const test_outcome &o) { return o.kind == kind; });
}

double aggregate_score(const vector<test_outcome> &outcomes) {
    double total = 0;
    size_t passed = 0;
    for (auto &o : outcomes) {
        if (o.kind != outcome::PASS) continue;
        total += o.run_time;
        ++passed;
    }
    // 没有通过任何测试点的提交总分为 0，这个分数在排行榜上反而是最好的
    return passed ? total / passed : 0;
}

void to_json(json &j, const test_case &value) {
    j = {{"id", value.id},
         {"name", value.name},
         {"size_category", value.size_category},
         {"difficulty", value.difficulty},
         {"data", value.data},
         {"expected_result", value.expected}};
}

void from_json(const json &j, test_case &value) {
    j.at("id").get_to(value.id);
    j.at("data").get_to(value.data);
    j.at("expected_result").get_to(value.expected);
    assign_optional(j, value.name, "name");
    assign_optional(j, value.size_category, "size_category");
    assign_optional(j, value.difficulty, "difficulty");
}

void to_json(json &j, const test_outcome &value) {
    j = {{"test_case_id", value.test_case_id},
         {"success", get_status_name(value.kind)},
         {"execution_time", value.run_time},
         {"error_message", value.message ? json(*value.message) : json()}};
}

void from_json(const json &j, test_outcome &value) {
    j.at("test_case_id").get_to(value.test_case_id);
    value.kind = parse_outcome(get_value<string>(j, "success"));
    j.at("execution_time").get_to(value.run_time);
    if (exists(j, "error_message"))
        value.message = get_value<string>(j, "error_message");
    else
        value.message.reset();
}

void to_json(json &j, const submission_result &value) {
    j = {{"sub_id", value.sub_id},
         {"status", get_status_name(value.status)},
         {"score", value.score},
         {"results", value.outcomes}};
}

}  // namespace sortbot

#include "server/memory_store.hpp"
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace sortbot::server {
using namespace std;
using namespace nlohmann;

memory_store::memory_store(const string &category_name) : category_name(category_name) {}

string memory_store::category() const {
    return category_name;
}

void memory_store::init(const filesystem::path &config_path) {
    json config = json::parse(read_file_content(config_path));
    assign_optional(config, category_name, "category");
    if (exists(config, "test_cases")) {
        for (auto &tc : config.at("test_cases").get<vector<test_case>>())
            add_test_case(tc);
    }
}

int memory_store::add_test_case(const test_case &tc) {
    scoped_lock guard(mut);
    int id = next_test_case_id++;
    test_cases[id] = tc;
    test_cases[id].id = id;
    return id;
}

vector<test_case> memory_store::get_test_cases() const {
    scoped_lock guard(mut);
    vector<test_case> result;
    for (auto &[id, tc] : test_cases) result.push_back(tc);
    return result;
}

string memory_store::submit(const bot_info &bot, const string &code) {
    submission_record record = make_submission(bot, code);
    string sub_id = record.sub_id;
    scoped_lock guard(mut);
    submissions[sub_id] = move(record);
    pending.push_back(sub_id);
    return sub_id;
}

bool memory_store::fetch_submission(evaluation_request &request) {
    scoped_lock guard(mut);
    if (pending.empty()) return false;
    submission_record &record = find(pending.front());
    pending.pop_front();

    vector<test_case> cases;
    for (auto &[id, tc] : test_cases) cases.push_back(tc);
    start_submission(record, cases);

    request.sub_id = record.sub_id;
    request.code = record.code;
    request.test_cases = move(cases);
    return true;
}

void memory_store::record_outcome(const string &sub_id, const test_outcome &result) {
    scoped_lock guard(mut);
    append_outcome(find(sub_id), result);
}

void memory_store::summarize(const string &sub_id, const submission_result &result) {
    scoped_lock guard(mut);
    complete_submission(find(sub_id), result);
}

void memory_store::summarize_failed(const string &sub_id, const string &reason) {
    scoped_lock guard(mut);
    submission_record &record = find(sub_id);
    bool was_pending = record.status == submission_status::PENDING;
    fail_submission(record, reason);
    if (was_pending) pending.erase(std::find(pending.begin(), pending.end(), sub_id));
}

submission_status memory_store::get_status(const string &sub_id) const {
    scoped_lock guard(mut);
    return find(sub_id).status;
}

vector<test_outcome> memory_store::get_results(const string &sub_id) const {
    scoped_lock guard(mut);
    return visible_results(find(sub_id));
}

vector<submission_record> memory_store::list_submissions() const {
    scoped_lock guard(mut);
    vector<submission_record> result;
    for (auto &[id, record] : submissions) result.push_back(record);
    return result;
}

submission_record memory_store::get_submission(const string &sub_id) const {
    scoped_lock guard(mut);
    return find(sub_id);
}

submission_record &memory_store::find(const string &sub_id) {
    auto it = submissions.find(sub_id);
    if (it == submissions.end()) throw store_error("unknown submission " + sub_id);
    return it->second;
}

const submission_record &memory_store::find(const string &sub_id) const {
    auto it = submissions.find(sub_id);
    if (it == submissions.end()) throw store_error("unknown submission " + sub_id);
    return it->second;
}

}  // namespace sortbot::server

#include "server/local/local.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <boost/lexical_cast.hpp>
#include "common/exceptions.hpp"
#include "common/interprocess.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace sortbot::server::local {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;
namespace ip = boost::interprocess;

configuration::configuration() : category_name("local") {}

string configuration::category() const {
    return category_name;
}

void configuration::init(const fs::path &config_path) {
    json config = json::parse(read_file_content(config_path));
    string category = get_value_def<string>(config, "local", "category");
    fs::path dir = get_value<string>(config, "root");
    if (dir.is_relative()) dir = config_path.parent_path() / dir;
    open(category, dir);
}

void configuration::open(const string &category, const fs::path &dir) {
    category_name = category;
    root = dir;
    fs::create_directories(root / "submissions");
    if (!fs::is_directory(root / "pending")) locked([&] { rebuild_pending_index(); });
    LOG(INFO) << "Opened local store " << category_name << " at " << root.string();
}

template <typename Func>
auto configuration::locked(Func &&func) const {
    scoped_lock guard(mut);
    try {
        ip::file_lock lock = lock_directory(root);
        ip::scoped_lock<ip::file_lock> file_guard(lock);
        return func();
    } catch (store_error &) {
        throw;
    } catch (std::exception &ex) {
        throw store_error("local store " + category_name + ": " + ex.what());
    }
}

fs::path configuration::test_cases_path() const {
    return root / "test_cases.json";
}

fs::path configuration::submission_path(const string &sub_id) const {
    return root / "submissions" / (assert_safe_path(sub_id) + ".json");
}

fs::path configuration::pending_path(const string &sub_id) const {
    return root / "pending" / assert_safe_path(sub_id);
}

vector<test_case> configuration::load_test_cases() const {
    json j = json::parse(read_file_content(test_cases_path(), "[]"));
    vector<test_case> cases = j.get<vector<test_case>>();
    sort(cases.begin(), cases.end(), [](const test_case &a, const test_case &b) { return a.id < b.id; });
    return cases;
}

submission_record configuration::load_submission(const string &sub_id) const {
    fs::path path = submission_path(sub_id);
    if (!fs::exists(path)) throw store_error("unknown submission " + sub_id);
    return json::parse(read_file_content(path)).get<submission_record>();
}

vector<submission_record> configuration::load_submissions() const {
    vector<submission_record> records;
    for (auto &entry : fs::directory_iterator(root / "submissions")) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        records.push_back(json::parse(read_file_content(entry.path())).get<submission_record>());
    }
    sort(records.begin(), records.end(), [](const submission_record &a, const submission_record &b) {
        return make_pair(a.submitted_at, a.sub_id) < make_pair(b.submitted_at, b.sub_id);
    });
    return records;
}

void configuration::save_submission(const submission_record &record) const {
    replace_file_content(submission_path(record.sub_id), json(record).dump(2));
}

void configuration::mark_pending(const submission_record &record) const {
    replace_file_content(pending_path(record.sub_id), to_string(record.submitted_at));
}

void configuration::unmark_pending(const string &sub_id) const {
    error_code ec;
    fs::remove(pending_path(sub_id), ec);
    if (ec) LOG(WARNING) << "Unable to remove pending index of submission " << sub_id << ": " << ec.message();
}

void configuration::rebuild_pending_index() const {
    fs::create_directories(root / "pending");
    size_t count = 0;
    for (auto &entry : fs::directory_iterator(root / "submissions")) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        try {
            auto record = json::parse(read_file_content(entry.path())).get<submission_record>();
            if (record.status != submission_status::PENDING) continue;
            mark_pending(record);
            ++count;
        } catch (json::exception &ex) {
            LOG(WARNING) << "Skipping malformed submission " << entry.path().string() << ": " << ex.what();
        }
    }
    LOG(INFO) << "Rebuilt pending index of local store " << category_name << " with " << count << " submissions";
}

vector<pair<int64_t, string>> configuration::load_pending_index() const {
    vector<pair<int64_t, string>> index;
    for (auto &entry : fs::directory_iterator(root / "pending")) {
        if (!entry.is_regular_file()) continue;
        string sub_id = entry.path().filename().string();
        try {
            index.emplace_back(boost::lexical_cast<int64_t>(read_file_content(entry.path())), sub_id);
        } catch (boost::bad_lexical_cast &) {
            // 索引文件损坏时以提交记录为准，提交记录不存在的索引在 fetch 时被删除
            fs::path path = submission_path(sub_id);
            index.emplace_back(fs::exists(path) ? load_submission(sub_id).submitted_at : 0, sub_id);
        }
    }
    sort(index.begin(), index.end());
    return index;
}

int configuration::add_test_case(const test_case &tc) {
    return locked([&] {
        vector<test_case> cases = load_test_cases();
        int id = 1;
        for (auto &c : cases) id = max(id, c.id + 1);
        cases.push_back(tc);
        cases.back().id = id;
        replace_file_content(test_cases_path(), json(cases).dump(2));
        return id;
    });
}

vector<test_case> configuration::get_test_cases() const {
    return locked([&] { return load_test_cases(); });
}

string configuration::submit(const bot_info &bot, const string &code) {
    submission_record record = make_submission(bot, code);
    locked([&] {
        save_submission(record);
        mark_pending(record);
    });
    return record.sub_id;
}

bool configuration::fetch_submission(evaluation_request &request) {
    return locked([&] {
        for (auto &entry : load_pending_index()) {
            const string &sub_id = entry.second;
            submission_record record;
            if (fs::exists(submission_path(sub_id))) record = load_submission(sub_id);
            if (record.sub_id.empty() || record.status != submission_status::PENDING) {
                LOG(WARNING) << "Dropping stale pending index of submission " << sub_id;
                unmark_pending(sub_id);
                continue;
            }

            vector<test_case> cases = load_test_cases();
            start_submission(record, cases);
            save_submission(record);
            unmark_pending(sub_id);

            request.sub_id = record.sub_id;
            request.code = record.code;
            request.test_cases = move(cases);
            return true;
        }
        return false;
    });
}

void configuration::record_outcome(const string &sub_id, const test_outcome &result) {
    locked([&] {
        submission_record record = load_submission(sub_id);
        append_outcome(record, result);
        save_submission(record);
    });
}

void configuration::summarize(const string &sub_id, const submission_result &result) {
    locked([&] {
        submission_record record = load_submission(sub_id);
        complete_submission(record, result);
        save_submission(record);
    });
}

void configuration::summarize_failed(const string &sub_id, const string &reason) {
    locked([&] {
        submission_record record = load_submission(sub_id);
        fail_submission(record, reason);
        save_submission(record);
        unmark_pending(sub_id);
    });
}

submission_status configuration::get_status(const string &sub_id) const {
    return locked([&] { return load_submission(sub_id).status; });
}

vector<test_outcome> configuration::get_results(const string &sub_id) const {
    return locked([&] { return visible_results(load_submission(sub_id)); });
}

submission_record configuration::get_submission(const string &sub_id) const {
    return locked([&] { return load_submission(sub_id); });
}

vector<submission_record> configuration::list_submissions() const {
    return locked([&] { return load_submissions(); });
}

}  // namespace sortbot::server::local

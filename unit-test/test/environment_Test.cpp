#include "test/environment.hpp"
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <fstream>
#include "common/utils.hpp"

namespace sortbot::test {
using namespace std;
namespace fs = std::filesystem;

const char *SORTED_BOT = R"(def sort_array(arr):
    return sorted(arr)
)";

const char *IDENTITY_BOT = R"(def sort_array(arr):
    return arr
)";

const char *RAISING_BOT = R"(def sort_array(arr):
    raise ValueError("boom")
)";

const char *LOOPING_BOT = R"(def sort_array(arr):
    while True:
        pass
)";

static fs::path run_dir = fs::temp_directory_path() / ("sortbot-test-" + to_string(getpid()));

fs::path test_run_dir() {
    return run_dir;
}

void setup_test_environment() {
    fs::create_directories(run_dir);
}

void teardown_test_environment() {
    error_code ec;
    fs::remove_all(run_dir, ec);
}

evaluator_config test_config(double timeout, size_t workers) {
    evaluator_config config;
    config.timeout = timeout;
    config.workers = workers;
    config.sandbox.python = "python3";
    config.sandbox.run_dir = run_dir;
    return config;
}

test_case make_case(int id, const vector<int64_t> &data) {
    test_case tc;
    tc.id = id;
    tc.name = "Test Case " + to_string(id);
    tc.size_category = "small";
    tc.difficulty = "random";
    tc.data = data;
    tc.expected = data;
    sort(tc.expected.begin(), tc.expected.end());
    return tc;
}

evaluation_request make_request(const string &code, const vector<test_case> &test_cases) {
    evaluation_request request;
    request.sub_id = random_uuid();
    request.code = code;
    request.test_cases = test_cases;
    return request;
}

size_t count_harness_files() {
    if (!fs::exists(run_dir)) return 0;
    return (size_t)count_if(fs::directory_iterator(run_dir), fs::directory_iterator(), [](const fs::directory_entry &entry) {
        return entry.path().extension() == ".py";
    });
}

bool process_gone(int pid) {
    if (kill(pid, 0) != 0) return true;
    // 没有 init 进程回收的孤儿进程会保持僵尸状态
    ifstream fin("/proc/" + to_string(pid) + "/stat");
    string content((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
    size_t pos = content.rfind(')');
    return pos != string::npos && pos + 2 < content.size() && content[pos + 2] == 'Z';
}

}  // namespace sortbot::test

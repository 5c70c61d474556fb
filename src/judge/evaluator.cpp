#include "judge/evaluator.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/harness.hpp"
#include "judge/verdict.hpp"

namespace sortbot {
using namespace std;

evaluator_config evaluator_config::from_globals() {
    evaluator_config config;
    config.timeout = TIMEOUT;
    config.workers = WORKERS;
    config.sandbox.python = PYTHON;
    config.sandbox.run_dir = RUN_DIR;
    config.sandbox.max_memory_mb = MEMORY_LIMIT;
    config.sandbox.output_limit = OUTPUT_LIMIT;
    config.sandbox.max_processes = PROCESS_LIMIT;
    config.sandbox.enabled = SANDBOX_ENABLED;
    config.sandbox.keep_files = DEBUG;
    return config;
}

evaluator::evaluator(const evaluator_config &config) : conf(config) {}

const evaluator_config &evaluator::config() const {
    return conf;
}

test_outcome evaluator::evaluate_test_case(const string &code, const test_case &tc) const {
    test_outcome result;
    try {
        string source = build_harness(code, tc);
        sandbox::run_result run = sandbox::run(source, conf.timeout, conf.sandbox);
        result = parse_verdict(run.out, run.err, run.timed_out, run.wall_time, conf.timeout);
    } catch (exception &ex) {
        LOG(WARNING) << "Test case " << tc.id << " failed to run: " << ex.what();
        result.kind = outcome::ERROR;
        result.run_time = 0;
        result.message = ex.what();
    }
    result.test_case_id = tc.id;
    return result;
}

submission_result evaluator::evaluate(const evaluation_request &request) const {
    LOG(INFO) << "Judging " << request;

    size_t n = request.test_cases.size();
    vector<optional<test_outcome>> slots(n);
    mutex slots_mutex;

    concurrent_queue<size_t> task_queue;
    for (size_t i = 0; i < n; ++i) task_queue.push(i);

    auto worker = [&] {
        size_t i;
        while (task_queue.try_pop(i)) {
            const test_case &tc = request.test_cases[i];
            test_outcome result = evaluate_test_case(request.code, tc);

            DLOG(INFO) << "Testcase [" << request.sub_id << "-" << tc.id
                       << ", status: " << get_display_message(result.kind)
                       << ", runtime: " << result.run_time
                       << ", message: " << result.message.value_or("") << "]";

            lock_guard<mutex> guard(slots_mutex);
            slots[i] = move(result);
        }
    };

    // 当前线程也参与评测，因此只需要额外启动 threads - 1 个线程
    size_t threads = min(max<size_t>(conf.workers, 1), max<size_t>(n, 1));
    vector<thread> pool;
    for (size_t i = 1; i < threads; ++i) {
        try {
            pool.emplace_back(worker);
        } catch (system_error &ex) {
            LOG(WARNING) << "Unable to start evaluation thread, continuing with " << pool.size() + 1 << " threads: " << ex.what();
            break;
        }
    }
    worker();
    for (auto &th : pool) th.join();

    submission_result result;
    result.sub_id = request.sub_id;
    for (size_t i = 0; i < n; ++i) {
        if (!slots[i])
            throw internal_error("test case " + to_string(request.test_cases[i].id) + " of submission " + request.sub_id + " has no outcome");
        result.outcomes.push_back(move(*slots[i]));
    }
    result.score = aggregate_score(result.outcomes);
    result.status = submission_status::COMPLETED;

    LOG(INFO) << "Submission " << request.sub_id << " completed, score: " << result.score
              << ", pass: " << result.count(outcome::PASS)
              << ", fail: " << result.count(outcome::FAIL)
              << ", error: " << result.count(outcome::ERROR)
              << ", timeout: " << result.count(outcome::TIMEOUT);
    return result;
}

}  // namespace sortbot

#include "worker.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <atomic>
#include <map>
#include "common/exceptions.hpp"

namespace sortbot {
using namespace std;
using namespace sortbot::server;

// 停止 worker 的标记
static atomic<bool> stop(false);

void stop_workers() {
    stop = true;
}

static map<string, unique_ptr<result_store>> stores;

// 下一次优先拉取的存储，轮流拉取避免某个存储饿死
static atomic<size_t> next_store(0);

void register_store(unique_ptr<result_store> &&store) {
    string category = store->category();
    if (stores.count(category))
        LOG(WARNING) << "Store " << category << " has been registered, replacing";
    stores[category] = move(store);
}

vector<result_store *> registered_stores() {
    vector<result_store *> result;
    for (auto &[category, store] : stores) result.push_back(store.get());
    return result;
}

static void report_failure(result_store &store, const string &sub_id, const string &reason) {
    try {
        store.summarize_failed(sub_id, reason);
    } catch (exception &ex) {
        LOG(ERROR) << "Unable to mark submission [" << store.category() << "-" << sub_id << "] as failed: " << ex.what();
    }
}

bool judge_submission(result_store &store, const evaluator &eval, const evaluation_request &request) {
    try {
        submission_result result = eval.evaluate(request);
        for (auto &o : result.outcomes)
            store.record_outcome(request.sub_id, o);
        store.summarize(request.sub_id, result);
        return true;
    } catch (judge_exception &ex) {
        LOG(ERROR) << "Submission [" << store.category() << "-" << request.sub_id << "] failed: " << ex;
        report_failure(store, request.sub_id, ex.what());
    } catch (exception &ex) {
        LOG(ERROR) << "Submission [" << store.category() << "-" << request.sub_id << "] failed: " << ex.what();
        report_failure(store, request.sub_id, ex.what());
    }
    return false;
}

/**
 * @brief 向每个存储拉取一个提交，拉取到提交后立即评测
 * @return true 如果获取到了提交
 */
static bool fetch_and_judge(size_t worker_id, const evaluator &eval) {
    vector<result_store *> all = registered_stores();
    size_t start = next_store++;
    for (size_t i = 0; i < all.size(); ++i) {
        result_store &store = *all[(start + i) % all.size()];
        evaluation_request request;
        try {
            if (!store.fetch_submission(request)) continue;
        } catch (exception &ex) {
            LOG(WARNING) << "Fetching from " << store.category() << ' ' << ex.what();
            continue;
        }

        LOG(INFO) << "Worker " << worker_id << " fetched submission [" << store.category() << "-" << request.sub_id << "]";
        judge_submission(store, eval, request);
        return true;
    }
    return false;
}

static void worker_loop(size_t worker_id, const evaluator &eval) {
    LOG(INFO) << "Worker " << worker_id << " started";
    while (!stop) {
        if (!fetch_and_judge(worker_id, eval))
            usleep(10 * 1000);  // 10ms，这里必须等待，不可以忙等
    }
    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, const evaluator &eval) {
    return thread([worker_id, &eval] {
        worker_loop(worker_id, eval);
    });
}

}  // namespace sortbot

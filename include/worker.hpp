#pragma once

#include <memory>
#include <thread>
#include <vector>
#include "judge/evaluator.hpp"
#include "server/store.hpp"

/**
 * 评测服务相关函数
 * 评测系统启动时注册若干个存储，然后启动若干个 worker 线程。
 * 每个 worker 轮流向所有存储拉取 PENDING 提交，评测完成后先逐个记录测试点的评测结果，
 * 最后提交总分，将提交标记为 COMPLETED。
 * 评测过程中存储层出错时，提交被标记为 FAILED。
 */
namespace sortbot {

/**
 * @brief 停止所有的 worker
 * 调用该函数后，将 worker 状态标记为停止。worker 完成当前提交的评测后退出。
 */
void stop_workers();

/**
 * @brief 注册存储
 * 必须在 worker 启动之前完成注册
 */
void register_store(std::unique_ptr<server::result_store> &&store);

/**
 * @brief 获取所有已注册的存储
 */
std::vector<server::result_store *> registered_stores();

/**
 * @brief 评测一个已经标记为 RUNNING 的提交，并将结果写回存储
 * 先记录每个测试点的结果，再提交总分。存储层出错时提交被标记为 FAILED，
 * 标记失败本身只会被记录到日志中。
 * @param store 提交所属的存储
 * @param eval 评测引擎
 * @param request 从存储中拉取的提交
 * @return 提交是否评测完成（COMPLETED）
 */
bool judge_submission(server::result_store &store, const evaluator &eval, const evaluation_request &request);

/**
 * @brief 启动评测 worker 线程
 * @param worker_id worker 编号，仅用于日志
 * @param eval 评测引擎，必须在线程结束前保持有效
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, const evaluator &eval);

}  // namespace sortbot

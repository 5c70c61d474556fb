#pragma once

#include <mutex>
#include <queue>

namespace sortbot {

/**
 * @brief 并发队列
 * 评测一个提交时，测试点下标先全部放入队列，再由多个评测线程争抢，
 * 队列为空即表示所有测试点都已经被领取
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队头元素
     */
    bool try_pop(T &element) {
        std::lock_guard<std::mutex> guard(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    void push(const T &value) {
        std::lock_guard<std::mutex> guard(mut);
        q.push(value);
    }

private:
    std::queue<T> q;
    std::mutex mut;
};

}  // namespace sortbot

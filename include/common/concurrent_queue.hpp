#pragma once

#include <mutex>
#include <queue>

namespace harness {

/**
 * @brief 并发队列
 * BatchRunner 在启动 worker 前一次性把所有待评测的任务放入队列，
 * worker 通过 try_pop 取任务，队列为空即表示没有剩余任务，因此不需要阻塞等待。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::lock_guard<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    void push(T value) {
        std::lock_guard<std::mutex> mlock(mut);
        q.push(std::move(value));
    }

private:
    std::queue<T> q;
    std::mutex mut;
};

}  // namespace harness

#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <atomic>

namespace harness {
using namespace std;

// 停止 worker 的标记
static atomic<bool> stop(false);

void stop_workers() {
    stop = true;
}

bool workers_stopped() {
    return stop;
}

void resume_workers() {
    stop = false;
}

/**
 * @brief worker 线程函数
 * 任务在启动 worker 之前就已经全部放入队列，因此队列为空时直接退出，不需要等待。
 */
static void worker_loop(size_t worker_id, concurrent_queue<const evaluation_task *> &task_queue, const task_handler &handler) {
    DLOG(INFO) << "Worker " << worker_id << " started";

    size_t processed = 0;
    while (!stop) {
        const evaluation_task *task = nullptr;
        if (!task_queue.try_pop(task)) break;

        try {
            handler(*task);
            ++processed;
        } catch (std::exception &ex) {
            // handler 自身已经隔离了选手代码带来的错误，能抛到这里的只有无法恢复的错误（比如结果文件无法写入）
            LOG(ERROR) << "Worker " << worker_id << " has crashed when processing " << task->cand.problem_id << "/"
                       << task->cand.solution_id << ", stopping all workers" << endl
                       << boost::diagnostic_information(ex);
            stop_workers();
        }
    }

    DLOG(INFO) << "Worker " << worker_id << " stopped after processing " << processed << " tasks";
}

thread start_worker(size_t worker_id, concurrent_queue<const evaluation_task *> &task_queue, task_handler handler) {
    return thread([worker_id, &task_queue, handler = move(handler)] {
        worker_loop(worker_id, task_queue, handler);
    });
}

}  // namespace harness

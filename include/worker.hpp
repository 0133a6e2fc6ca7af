#pragma once

#include <functional>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "harness/problem.hpp"

/**
 * 评测 worker 相关函数
 * BatchRunner 先把所有待评测的任务放入任务队列，再启动若干 worker 线程。
 * 每个 worker 不断从队列中取出一个任务并完整地处理（构建、执行、持久化），
 * 然后再取下一个，直到队列为空或者 worker 被要求停止。
 * 每个 worker 同时最多只有一个子进程在运行。
 */
namespace harness {

/**
 * @brief 处理一个评测任务的函数
 */
using task_handler = std::function<void(const evaluation_task &)>;

/**
 * @brief 停止所有的 worker
 * 调用该函数后，将 worker 状态标记为停止。worker 循环时会检查标记，
 * 如果停止，则不再取新的任务，正在处理的任务会正常完成并持久化。
 * 可以在信号处理函数中调用。
 */
void stop_workers();

/**
 * @brief worker 是否已经被要求停止
 */
bool workers_stopped();

/**
 * @brief 清除停止标记，使之后启动的 worker 可以正常工作
 */
void resume_workers();

/**
 * @brief 启动评测 worker 线程
 * @param worker_id worker 编号，用于日志
 * @param task_queue 待评测任务的队列，队列为空时 worker 退出
 * @param handler 处理评测任务的函数，抛出异常时停止所有 worker
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, concurrent_queue<const evaluation_task *> &task_queue, task_handler handler);

}  // namespace harness

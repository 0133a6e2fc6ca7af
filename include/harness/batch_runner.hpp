#pragma once

#include <map>
#include <vector>
#include "common/status.hpp"
#include "harness/executor.hpp"
#include "harness/problem.hpp"
#include "harness/result_store.hpp"
#include "harness/test_case_builder.hpp"

namespace harness {

struct batch_options {
    /**
     * @brief 同时评测的 worker 数，至少为 1
     */
    std::size_t concurrency = 1;

    execution_limits limits;
};

/**
 * @brief 一次批量评测的统计信息
 */
struct batch_summary {
    /**
     * @brief 输入中的任务总数
     */
    std::size_t total = 0;

    /**
     * @brief 本次实际执行并写入结果文件的任务数
     */
    std::size_t executed = 0;

    /**
     * @brief 结果文件中已经存在记录而被跳过的任务数
     */
    std::size_t already_processed = 0;

    /**
     * @brief 与输入中更早的任务 (problem_id, solution_id) 相同而被跳过的任务数
     */
    std::size_t duplicates = 0;

    /**
     * @brief 本次执行的任务按评测状态的计数
     */
    std::map<status, std::size_t> tally;

    /**
     * @brief 是否因为 stop_workers 而没有处理完所有任务
     */
    bool interrupted = false;
};

/**
 * @brief 批量评测所有 (题目, 候选解) 对
 *
 * 每个任务依次经过：test_case_builder 构建 → executor 执行 → result_store 持久化。
 * 一个任务的处理过程中出现的任何异常都只影响该任务，记为 HARNESS_INTERNAL_ERROR，
 * 其余任务继续评测。只有结果文件无法写入时整个批次才会停止。
 */
class batch_runner {
public:
    /**
     * @param exec 所有 worker 共享的执行器，必须是线程安全的
     * @param store 结果文件，用于跳过已经评测过的任务
     */
    batch_runner(test_case_builder builder, executor &exec, result_store &store, batch_options options);

    /**
     * @brief 评测所有任务，直到全部完成或者 worker 被 stop_workers 停止
     * @throw internal_error 若结果文件无法写入
     */
    batch_summary run(const std::vector<evaluation_task> &tasks);

    /**
     * @brief 评测一个任务，不会抛出异常
     */
    result_record evaluate(const evaluation_task &task);

private:
    test_case_builder builder;
    executor &exec;
    result_store &store;
    batch_options options;
};

}  // namespace harness

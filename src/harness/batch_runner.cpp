#include "harness/batch_runner.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <mutex>
#include <set>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "worker.hpp"

namespace harness {
using namespace std;

/**
 * @brief 每写入多少条记录输出一次进度
 */
static const size_t PROGRESS_INTERVAL = 100;

batch_runner::batch_runner(test_case_builder builder, executor &exec, result_store &store, batch_options options)
    : builder(move(builder)), exec(exec), store(store), options(move(options)) {
    if (this->options.concurrency == 0) this->options.concurrency = 1;
}

result_record batch_runner::evaluate(const evaluation_task &task) {
    elapsed_time timer;
    try {
        build_result built = builder.build(*task.prob, task.cand);
        execution_outcome outcome = visit(overloaded{
                                              [](execution_outcome &immediate) { return move(immediate); },
                                              [&](test_artifact &artifact) { return exec.execute(artifact, options.limits); }},
                                          built);
        return make_record(task.cand, move(outcome));
    } catch (std::exception &ex) {
        LOG(ERROR) << "Internal error when evaluating " << task.cand.problem_id << "/" << task.cand.solution_id
                   << " (line " << task.line << ")" << endl
                   << boost::diagnostic_information(ex);
        return make_record(task.cand, make_outcome(failure_kind::HARNESS_INTERNAL_ERROR, task.prob->public_tests.size(),
                                                   string("internal error: ") + ex.what(), timer.seconds()));
    }
}

batch_summary batch_runner::run(const vector<evaluation_task> &tasks) {
    batch_summary summary;
    summary.total = tasks.size();

    set<pair<string, string>> seen;
    concurrent_queue<const evaluation_task *> task_queue;
    size_t pending = 0;
    for (auto &task : tasks) {
        const candidate &cand = task.cand;
        if (store.contains(cand.problem_id, cand.solution_id)) {
            LOG(INFO) << "Skipping " << cand.problem_id << "/" << cand.solution_id << ": already processed";
            ++summary.already_processed;
            continue;
        }
        if (!seen.emplace(cand.problem_id, cand.solution_id).second) {
            LOG(WARNING) << "Skipping duplicate candidate " << cand.problem_id << "/" << cand.solution_id
                         << " at line " << task.line;
            ++summary.duplicates;
            continue;
        }
        task_queue.push(&task);
        ++pending;
    }

    LOG(INFO) << "Evaluating " << pending << " candidates with " << options.concurrency << " workers, "
              << summary.already_processed << " already processed, " << summary.duplicates << " duplicates";

    std::mutex summary_mutex;
    exception_ptr fatal;
    auto handler = [&](const evaluation_task &task) {
        result_record record = evaluate(task);
        try {
            store.append(record);
        } catch (std::exception &ex) {
            scoped_lock guard(summary_mutex);
            if (!fatal) fatal = current_exception();
            throw;
        }

        scoped_lock guard(summary_mutex);
        ++summary.executed;
        ++summary.tally[record.outcome.status];
        LOG(INFO) << "Evaluated " << record.problem_id << "/" << record.solution_id << ": "
                  << to_string(record.outcome.status) << " (" << to_string(record.outcome.kind) << ") in "
                  << record.outcome.elapsed_seconds << "s";
        if (summary.executed % PROGRESS_INTERVAL == 0)
            LOG(INFO) << "Progress: " << summary.executed << "/" << pending << " candidates evaluated";
    };

    vector<thread> workers;
    size_t worker_count = min(options.concurrency, pending);
    for (size_t i = 0; i < worker_count; ++i)
        workers.push_back(start_worker(i, task_queue, handler));
    for (auto &worker : workers)
        worker.join();

    if (fatal) {
        try {
            rethrow_exception(fatal);
        } catch (std::exception &ex) {
            throw internal_error(string("unable to persist result record: ") + ex.what());
        }
    }

    summary.interrupted = summary.executed < pending;
    if (summary.interrupted)
        LOG(WARNING) << "Batch interrupted, " << pending - summary.executed << " candidates left unevaluated";

    for (auto &[st, count] : summary.tally)
        LOG(INFO) << to_string(st) << ": " << count;
    LOG(INFO) << "Batch finished: " << summary.executed << " executed, " << summary.already_processed
              << " already processed, " << summary.duplicates << " duplicates";
    return summary;
}

}  // namespace harness

#include <atomic>
#include <set>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "harness/batch_runner.hpp"
#include "test/environment.hpp"
#include "test/mock_executor.hpp"
#include "worker.hpp"

using namespace std;
using namespace harness;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
namespace fs = std::filesystem;

static const char *PASSING_SOURCE = "def solve(lines):\n    return 3\n";

class BatchRunnerTest : public ::testing::Test {
protected:
    fs::path dir;
    fs::path output;
    shared_ptr<const problem> prob = make_problem("p1", {{"1 2", "3"}, {"2 1", "3"}});

    void SetUp() override {
        resume_workers();
        dir = make_temp_dir("batch");
        output = dir / "unittest_results.jsonl";
    }

    void TearDown() override {
        resume_workers();
        fs::remove_all(dir);
    }

    static execution_outcome passed(size_t num_tests) {
        vector<test_result> tests;
        for (size_t i = 0; i < num_tests; ++i)
            tests.push_back({i, true, failure_kind::NONE, nullopt});
        return summarize_tests(tests, num_tests);
    }

    vector<evaluation_task> make_tasks(size_t count) {
        vector<evaluation_task> tasks;
        for (size_t i = 0; i < count; ++i)
            tasks.push_back(make_task(prob, "s" + to_string(i), PASSING_SOURCE));
        return tasks;
    }

    batch_options options(size_t concurrency) {
        batch_options opt;
        opt.concurrency = concurrency;
        opt.limits = execution_limits::from_config();
        return opt;
    }
};

TEST_F(BatchRunnerTest, EveryPairIsRecordedOnce) {
    mock::mock_executor exec;
    EXPECT_CALL(exec, execute(_, _)).Times(20).WillRepeatedly(Return(passed(2)));

    result_store store(output, true);
    batch_runner runner(test_case_builder(RUN_DIR), exec, store, options(4));
    batch_summary summary = runner.run(make_tasks(20));

    EXPECT_EQ(summary.total, 20u);
    EXPECT_EQ(summary.executed, 20u);
    EXPECT_EQ(summary.already_processed, 0u);
    EXPECT_EQ(summary.tally[status::PASS], 20u);
    EXPECT_FALSE(summary.interrupted);

    auto lines = read_lines(output);
    ASSERT_EQ(lines.size(), 20u);
    set<string> ids;
    for (auto &line : lines) ids.insert(nlohmann::json::parse(line)["solution_id"].get<string>());
    EXPECT_EQ(ids.size(), 20u);
}

TEST_F(BatchRunnerTest, RerunSkipsProcessedPairs) {
    auto tasks = make_tasks(5);
    {
        mock::mock_executor exec;
        EXPECT_CALL(exec, execute(_, _)).Times(5).WillRepeatedly(Return(passed(2)));
        result_store store(output, true);
        batch_runner(test_case_builder(RUN_DIR), exec, store, options(2)).run(tasks);
    }
    auto first = read_lines(output);

    mock::mock_executor exec;
    EXPECT_CALL(exec, execute(_, _)).Times(0);
    result_store store(output, true);
    batch_summary summary = batch_runner(test_case_builder(RUN_DIR), exec, store, options(2)).run(tasks);

    EXPECT_EQ(summary.executed, 0u);
    EXPECT_EQ(summary.already_processed, 5u);
    EXPECT_EQ(read_lines(output), first);
}

TEST_F(BatchRunnerTest, PartialRunIsCompletedOnResume) {
    auto tasks = make_tasks(6);
    {
        mock::mock_executor exec;
        EXPECT_CALL(exec, execute(_, _)).Times(3).WillRepeatedly(Return(passed(2)));
        result_store store(output, true);
        vector<evaluation_task> first_half(tasks.begin(), tasks.begin() + 3);
        batch_runner(test_case_builder(RUN_DIR), exec, store, options(1)).run(first_half);
    }

    mock::mock_executor exec;
    EXPECT_CALL(exec, execute(_, _)).Times(3).WillRepeatedly(Return(passed(2)));
    result_store store(output, true);
    batch_summary summary = batch_runner(test_case_builder(RUN_DIR), exec, store, options(1)).run(tasks);

    EXPECT_EQ(summary.executed, 3u);
    EXPECT_EQ(summary.already_processed, 3u);
    EXPECT_EQ(read_lines(output).size(), 6u);
}

TEST_F(BatchRunnerTest, DuplicatesAreExecutedOnce) {
    auto tasks = make_tasks(2);
    tasks.push_back(make_task(prob, "s0", PASSING_SOURCE));

    mock::mock_executor exec;
    EXPECT_CALL(exec, execute(_, _)).Times(2).WillRepeatedly(Return(passed(2)));
    result_store store(output, true);
    batch_summary summary = batch_runner(test_case_builder(RUN_DIR), exec, store, options(1)).run(tasks);

    EXPECT_EQ(summary.executed, 2u);
    EXPECT_EQ(summary.duplicates, 1u);
    EXPECT_EQ(read_lines(output).size(), 2u);
}

TEST_F(BatchRunnerTest, InternalErrorIsIsolated) {
    auto tasks = make_tasks(3);

    mock::mock_executor exec;
    EXPECT_CALL(exec, execute(_, _))
        .WillOnce(Return(passed(2)))
        .WillOnce(Invoke([](const test_artifact &, const execution_limits &) -> execution_outcome {
            throw internal_error("executor exploded");
        }))
        .WillOnce(Return(passed(2)));
    result_store store(output, true);
    batch_summary summary = batch_runner(test_case_builder(RUN_DIR), exec, store, options(1)).run(tasks);

    EXPECT_EQ(summary.executed, 3u);
    EXPECT_EQ(summary.tally[status::PASS], 2u);
    EXPECT_EQ(summary.tally[status::ERROR], 1u);

    auto lines = read_lines(output);
    ASSERT_EQ(lines.size(), 3u);
    auto failed = nlohmann::json::parse(lines[1]);
    EXPECT_EQ(failed["solution_id"], "s1");
    EXPECT_EQ(failed["status"], "error");
    EXPECT_EQ(failed["kind"], "harness_internal_error");
    EXPECT_NE(failed["error_message"].get<string>().find("executor exploded"), string::npos);
}

TEST_F(BatchRunnerTest, ImmediateOutcomesSkipExecution) {
    vector<evaluation_task> tasks;
    tasks.push_back(make_task(prob, "empty", ""));
    tasks.push_back(make_task(make_problem("p2", {}), "no-tests", PASSING_SOURCE));

    mock::mock_executor exec;
    EXPECT_CALL(exec, execute(_, _)).Times(0);
    result_store store(output, true);
    batch_summary summary = batch_runner(test_case_builder(RUN_DIR), exec, store, options(1)).run(tasks);

    EXPECT_EQ(summary.executed, 2u);
    EXPECT_EQ(summary.tally[status::ERROR], 1u);
    EXPECT_EQ(summary.tally[status::PASS], 1u);
}

TEST_F(BatchRunnerTest, StoppedWorkersLeavePairsForResume) {
    auto tasks = make_tasks(5);

    mock::mock_executor exec;
    atomic<int> calls(0);
    EXPECT_CALL(exec, execute(_, _)).WillRepeatedly(Invoke([&](const test_artifact &, const execution_limits &) {
        if (++calls == 2) stop_workers();
        return passed(2);
    }));
    result_store store(output, true);
    batch_summary summary = batch_runner(test_case_builder(RUN_DIR), exec, store, options(1)).run(tasks);

    EXPECT_EQ(summary.executed, 2u);
    EXPECT_TRUE(summary.interrupted);
    EXPECT_EQ(read_lines(output).size(), 2u);
}

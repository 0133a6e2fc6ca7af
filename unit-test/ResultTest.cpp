#include "gtest/gtest.h"
#include "harness/result.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace harness;
using namespace nlohmann;

TEST(StatusTest, KindMapsToStatus) {
    EXPECT_EQ(status_of(failure_kind::NONE), status::PASS);
    EXPECT_EQ(status_of(failure_kind::NO_TESTS), status::PASS);
    EXPECT_EQ(status_of(failure_kind::ASSERTION_FAILURE), status::FAIL);
    EXPECT_EQ(status_of(failure_kind::MISSING_ENTRY_POINT), status::ERROR);
    EXPECT_EQ(status_of(failure_kind::CANDIDATE_RAISED), status::ERROR);
    EXPECT_EQ(status_of(failure_kind::TRANSPORT_ERROR), status::ERROR);
    EXPECT_EQ(status_of(failure_kind::HARNESS_INTERNAL_ERROR), status::ERROR);
    EXPECT_EQ(status_of(failure_kind::TIMEOUT), status::TIMEOUT);
    EXPECT_EQ(status_of(failure_kind::CHILD_CRASHED), status::CRASHED);
}

TEST(StatusTest, NamesAreParsedBack) {
    EXPECT_STREQ(to_string(status::CRASHED), "crashed");
    EXPECT_STREQ(to_string(failure_kind::HARNESS_INTERNAL_ERROR), "harness_internal_error");
    EXPECT_EQ(parse_status("timeout"), status::TIMEOUT);
    EXPECT_EQ(parse_failure_kind("child_crashed"), failure_kind::CHILD_CRASHED);
    EXPECT_THROW(parse_status("accepted"), invalid_argument);
}

TEST(ResultRecordTest, MetadataIsPassedThrough) {
    candidate cand;
    cand.problem_id = "1000_A";
    cand.solution_id = "7";
    cand.metadata = {{"model", "gpt"}, {"temperature", 0.7}, {"status", "bogus"}};

    vector<test_result> tests(2);
    tests[0] = {0, true, failure_kind::NONE, nullopt};
    tests[1] = {1, false, failure_kind::ASSERTION_FAILURE, string("test 1: output mismatch: expected \"3\" but got \"4\"")};
    execution_outcome outcome = summarize_tests(tests, 2);
    outcome.stdout_text = "debug\n";
    outcome.elapsed_seconds = 0.25;

    json j = make_record(cand, outcome);
    json expected = {
        {"problem_id", "1000_A"},
        {"solution_id", "7"},
        {"model", "gpt"},
        {"temperature", 0.7},
        {"status", "fail"},
        {"kind", "assertion_failure"},
        {"num_tests", 2},
        {"per_test_results", {{{"index", 0}, {"passed", true}, {"kind", "none"}, {"detail", nullptr}},
                              {{"index", 1}, {"passed", false}, {"kind", "assertion_failure"}, {"detail", "test 1: output mismatch: expected \"3\" but got \"4\""}}}},
        {"error_message", "1 of 2 tests failed"},
        {"stdout", "debug\n"},
        {"elapsed_seconds", 0.25}};
    EXPECT_JSON_EQ(j, expected);

    result_record parsed = j.get<result_record>();
    EXPECT_EQ(parsed.problem_id, "1000_A");
    EXPECT_EQ(parsed.outcome.status, status::FAIL);
    EXPECT_EQ(parsed.outcome.tests.size(), 2u);
    EXPECT_JSON_EQ(parsed.metadata, json({{"model", "gpt"}, {"temperature", 0.7}}));
}

#include "harness/result.hpp"
#include <fmt/core.h>

namespace harness {
using namespace std;
using namespace nlohmann;

execution_outcome make_outcome(failure_kind kind, size_t num_tests, optional<string> error_message, double elapsed_seconds) {
    execution_outcome outcome;
    outcome.status = status_of(kind);
    outcome.kind = kind;
    outcome.num_tests = num_tests;
    outcome.error_message = move(error_message);
    outcome.elapsed_seconds = elapsed_seconds;
    return outcome;
}

execution_outcome summarize_tests(vector<test_result> tests, size_t num_tests) {
    size_t failed = 0;
    const test_result *first_raised = nullptr;
    for (auto &test : tests) {
        if (test.passed) continue;
        ++failed;
        if (test.kind == failure_kind::CANDIDATE_RAISED && !first_raised)
            first_raised = &test;
    }

    execution_outcome outcome;
    if (first_raised) {
        outcome = make_outcome(failure_kind::CANDIDATE_RAISED, num_tests,
                               fmt::format("test {} raised: {}", first_raised->index, first_raised->detail.value_or("")));
    } else if (failed > 0) {
        outcome = make_outcome(failure_kind::ASSERTION_FAILURE, num_tests,
                               fmt::format("{} of {} tests failed", failed, num_tests));
    } else {
        outcome = make_outcome(failure_kind::NONE, num_tests, nullopt);
    }
    outcome.tests = move(tests);
    return outcome;
}

result_record make_record(const candidate &cand, execution_outcome outcome) {
    result_record record;
    record.problem_id = cand.problem_id;
    record.solution_id = cand.solution_id;
    record.outcome = move(outcome);
    record.metadata = cand.metadata;
    return record;
}

void to_json(json &j, const test_result &result) {
    j = {{"index", result.index},
         {"passed", result.passed},
         {"kind", to_string(result.kind)},
         {"detail", result.detail ? json(*result.detail) : json(nullptr)}};
}

void from_json(const json &j, test_result &result) {
    j.at("index").get_to(result.index);
    j.at("passed").get_to(result.passed);
    if (j.count("kind"))
        result.kind = parse_failure_kind(j.at("kind").get<string>());
    else
        result.kind = result.passed ? failure_kind::NONE : failure_kind::ASSERTION_FAILURE;
    if (j.count("detail") && !j.at("detail").is_null())
        result.detail = j.at("detail").get<string>();
    else
        result.detail.reset();
}

void to_json(json &j, const result_record &record) {
    j = record.metadata.is_object() ? record.metadata : json::object();
    const execution_outcome &outcome = record.outcome;
    j["problem_id"] = record.problem_id;
    j["solution_id"] = record.solution_id;
    j["status"] = to_string(outcome.status);
    j["kind"] = to_string(outcome.kind);
    j["num_tests"] = outcome.num_tests;
    j["per_test_results"] = outcome.tests;
    j["error_message"] = outcome.error_message ? json(*outcome.error_message) : json(nullptr);
    j["stdout"] = outcome.stdout_text;
    j["elapsed_seconds"] = outcome.elapsed_seconds;
}

void from_json(const json &j, result_record &record) {
    static const char *fixed_keys[] = {"problem_id", "solution_id", "status", "kind", "num_tests",
                                       "per_test_results", "error_message", "stdout", "elapsed_seconds"};

    j.at("problem_id").get_to(record.problem_id);
    j.at("solution_id").get_to(record.solution_id);

    execution_outcome &outcome = record.outcome;
    outcome.status = parse_status(j.at("status").get<string>());
    outcome.kind = j.count("kind") ? parse_failure_kind(j.at("kind").get<string>()) : failure_kind::NONE;
    outcome.num_tests = j.value("num_tests", (size_t)0);
    outcome.tests = j.value("per_test_results", vector<test_result>());
    if (j.count("error_message") && !j.at("error_message").is_null())
        outcome.error_message = j.at("error_message").get<string>();
    outcome.stdout_text = j.value("stdout", string());
    outcome.elapsed_seconds = j.value("elapsed_seconds", 0.0);

    record.metadata = j;
    for (const char *key : fixed_keys) record.metadata.erase(key);
}

}  // namespace harness

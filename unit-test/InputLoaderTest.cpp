#include <sstream>
#include "gtest/gtest.h"
#include "harness/input_loader.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace harness;
using namespace nlohmann;

static load_result load(const string &content) {
    istringstream in(content);
    return load_candidates(in, "input.jsonl");
}

TEST(InputLoaderTest, ListShapeTests) {
    auto tests = parse_public_tests(json::parse(R"([{"input": "1 2\n", "output": "3\n"}, {"input": "", "output": "0"}])"));
    ASSERT_EQ(tests.size(), 2u);
    EXPECT_EQ(tests[0].input, "1 2\n");
    EXPECT_EQ(tests[0].output, "3\n");
    EXPECT_EQ(tests[1].input, "");
}

TEST(InputLoaderTest, ColumnarShapeTestsAreZippedAndTrimmed) {
    auto tests = parse_public_tests(json::parse(R"({"input": [" 1 2\n", "3 4\n", "5 6"], "output": ["3\n", " 7 "]})"));
    ASSERT_EQ(tests.size(), 2u);
    EXPECT_EQ(tests[0].input, "1 2");
    EXPECT_EQ(tests[0].output, "3");
    EXPECT_EQ(tests[1].input, "3 4");
    EXPECT_EQ(tests[1].output, "7");
}

TEST(InputLoaderTest, MissingTestsAreEmpty) {
    EXPECT_TRUE(parse_public_tests(json()).empty());
    EXPECT_TRUE(parse_public_tests(json::array()).empty());
    EXPECT_TRUE(parse_public_tests(json::object()).empty());
    EXPECT_THROW(parse_public_tests(json("1 2")), invalid_argument);
    EXPECT_THROW(parse_public_tests(json::parse(R"([{"input": 1, "output": "2"}])")), invalid_argument);
}

TEST(InputLoaderTest, CandidatesShareProblem) {
    auto result = load(
        R"({"problem_id": "p1", "solution_id": "a", "generated_solution": "def solve(l):\n    return 1", "public_tests": [{"input": "1", "output": "1"}], "model": "m1", "description": "echo"})"
        "\n\n"
        R"({"problem_id": "p1", "solution_id": "b", "generated_solution": "def solve(l):\n    return 2", "public_tests": [{"input": "1", "output": "1"}], "model": "m2"})"
        "\n");

    EXPECT_EQ(result.skipped, 0u);
    ASSERT_EQ(result.tasks.size(), 2u);
    EXPECT_EQ(result.tasks[0].prob, result.tasks[1].prob);
    EXPECT_EQ(result.tasks[0].prob->description, "echo");
    EXPECT_EQ(result.tasks[0].line, 1u);
    EXPECT_EQ(result.tasks[1].line, 3u);
    EXPECT_EQ(result.tasks[1].cand.source, "def solve(l):\n    return 2");
    EXPECT_JSON_EQ(result.tasks[0].cand.metadata, json({{"model", "m1"}, {"description", "echo"}}));
}

TEST(InputLoaderTest, FirstOccurrenceDefinesProblem) {
    auto result = load(
        R"({"problem_id": "p1", "solution_id": "a", "generated_solution": "", "public_tests": [{"input": "1", "output": "1"}]})"
        "\n"
        R"({"problem_id": "p1", "solution_id": "b", "generated_solution": "", "public_tests": []})"
        "\n");
    ASSERT_EQ(result.tasks.size(), 2u);
    EXPECT_EQ(result.tasks[1].prob->public_tests.size(), 1u);
}

TEST(InputLoaderTest, CompletionIndexIsSolutionId) {
    auto result = load(R"({"problem_id": "p1", "completion_index": 3, "generated_solution": "x = 1", "public_tests": []})"
                       "\n");
    ASSERT_EQ(result.tasks.size(), 1u);
    EXPECT_EQ(result.tasks[0].cand.solution_id, "3");
    EXPECT_JSON_EQ(result.tasks[0].cand.metadata, json({{"completion_index", 3}}));
}

TEST(InputLoaderTest, MalformedLinesAreSkipped) {
    auto result = load(
        "{not json\n"
        R"({"solution_id": "a", "generated_solution": "", "public_tests": []})"
        "\n"
        R"({"problem_id": "p1", "generated_solution": "", "public_tests": []})"
        "\n"
        R"({"problem_id": "p1", "solution_id": "a", "generated_solution": null, "public_tests": []})"
        "\n"
        R"({"problem_id": "p1", "solution_id": "a", "generated_solution": "", "public_tests": "oops"})"
        "\n"
        "[1, 2]\n"
        R"({"problem_id": "p1", "solution_id": "ok", "generated_solution": "", "public_tests": []})"
        "\n");
    EXPECT_EQ(result.skipped, 6u);
    ASSERT_EQ(result.tasks.size(), 1u);
    EXPECT_EQ(result.tasks[0].cand.solution_id, "ok");
    EXPECT_EQ(result.tasks[0].line, 7u);
}

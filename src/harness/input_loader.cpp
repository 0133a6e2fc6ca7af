#include "harness/input_loader.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <glog/logging.h>
#include <fstream>
#include <map>
#include <system_error>
#include "common/json_utils.hpp"

namespace harness {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static string expect_string(const json &value, const char *field) {
    if (!value.is_string())
        throw invalid_argument(string("field '") + field + "' of public test is not a string");
    return value.get<string>();
}

vector<test_case> parse_public_tests(const json &tests) {
    vector<test_case> result;
    if (tests.is_null()) return result;

    if (tests.is_array()) {
        for (auto &test : tests) {
            if (!test.is_object() || !test.count("input") || !test.count("output"))
                throw invalid_argument("public test must be an object with input and output");
            result.push_back({expect_string(test.at("input"), "input"),
                              expect_string(test.at("output"), "output")});
        }
    } else if (tests.is_object()) {
        json inputs = access_optional(tests, "input"), outputs = access_optional(tests, "output");
        if (inputs.is_null() && outputs.is_null()) return result;
        if (!inputs.is_array() || !outputs.is_array())
            throw invalid_argument("columnar public tests must contain input and output lists");
        size_t count = min(inputs.size(), outputs.size());
        for (size_t i = 0; i < count; ++i) {
            result.push_back({boost::algorithm::trim_copy(expect_string(inputs[i], "input")),
                              boost::algorithm::trim_copy(expect_string(outputs[i], "output"))});
        }
    } else {
        throw invalid_argument("public_tests must be a list or an object");
    }
    return result;
}

static bool same_tests(const vector<test_case> &a, const vector<test_case> &b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
        if (a[i].input != b[i].input || a[i].output != b[i].output) return false;
    return true;
}

/**
 * @brief 读取 solution_id，缺失时使用生成阶段的 completion_index
 */
static string read_solution_id(const json &j) {
    json id = access_optional(j, "solution_id");
    if (id.is_null()) id = access_optional(j, "completion_index");
    if (id.is_string()) return id.get<string>();
    if (id.is_number_integer()) return std::to_string(id.get<long long>());
    throw invalid_argument("missing solution_id and completion_index");
}

load_result load_candidates(istream &in, const string &source_name) {
    load_result result;
    map<string, shared_ptr<const problem>> problems;

    string line;
    size_t line_number = 0;
    while (getline(in, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r\n") == string::npos) continue;

        try {
            json j = json::parse(line);
            if (!j.is_object())
                throw invalid_argument("record is not a json object");

            json problem_id = access_optional(j, "problem_id");
            if (!problem_id.is_string() && !problem_id.is_number_integer())
                throw invalid_argument("missing problem_id");

            candidate cand;
            cand.problem_id = problem_id.is_string() ? problem_id.get<string>() : std::to_string(problem_id.get<long long>());
            cand.solution_id = read_solution_id(j);

            json source = access_optional(j, "generated_solution");
            if (!source.is_string())
                throw invalid_argument("generated_solution is not a string");
            cand.source = source.get<string>();

            vector<test_case> tests = parse_public_tests(access_optional(j, "public_tests"));

            cand.metadata = j;
            for (const char *key : {"problem_id", "solution_id", "generated_solution", "public_tests"})
                cand.metadata.erase(key);

            auto it = problems.find(cand.problem_id);
            if (it == problems.end()) {
                auto prob = make_shared<problem>();
                prob->id = cand.problem_id;
                prob->description = get_value_def(j, string(), "description");
                prob->public_tests = move(tests);
                it = problems.emplace(cand.problem_id, prob).first;
            } else if (!same_tests(it->second->public_tests, tests)) {
                LOG(WARNING) << source_name << ":" << line_number << ": public_tests of problem " << cand.problem_id
                             << " differ from its first occurrence, using the first one";
            }

            result.tasks.push_back({it->second, move(cand), line_number});
        } catch (json::exception &ex) {
            LOG(WARNING) << source_name << ":" << line_number << ": skipping malformed record: " << ex.what();
            ++result.skipped;
        } catch (invalid_argument &ex) {
            LOG(WARNING) << source_name << ":" << line_number << ": skipping invalid record: " << ex.what();
            ++result.skipped;
        }
    }

    LOG(INFO) << "Loaded " << result.tasks.size() << " candidates of " << problems.size() << " problems from "
              << source_name << ", skipped " << result.skipped << " lines";
    return result;
}

load_result load_candidates(const fs::path &path) {
    ifstream fin(path);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open input file " + path.string());
    return load_candidates(fin, path.string());
}

}  // namespace harness

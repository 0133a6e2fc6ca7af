#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <map>
#include "config.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"

using namespace std;
using namespace harness;
using namespace nlohmann;
namespace fs = std::filesystem;

/**
 * 这些测试会启动 harness 可执行文件，检查退出码与结果文件
 */
class CommandLineTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = make_temp_dir("cli");
    }

    /**
     * @brief 以 args 为参数运行 harness，stdout 与 stderr 写入 dir/cli.log
     * @return waitpid 得到的状态
     */
    int run_cli(vector<string> args) {
        if (find(args.begin(), args.end(), "--runner") == args.end()) {
            args.push_back("--runner");
            args.push_back(RUNNER_PATH.string());
        }
        args.insert(args.begin(), HARNESS_CLI_PATH);
        args.push_back("--run-dir");
        args.push_back(RUN_DIR.string());
        vector<char *> argv;
        for (auto &arg : args) argv.push_back(const_cast<char *>(arg.c_str()));
        argv.push_back(nullptr);
        string log_file = (dir / "cli.log").string();

        pid_t pid = fork();
        if (pid == 0) {
            int fd = open(log_file.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd < 0) _exit(126);
            dup2(fd, STDOUT_FILENO);
            dup2(fd, STDERR_FILENO);
            execv(argv[0], argv.data());
            _exit(127);
        }
        int wstatus = -1;
        EXPECT_GT(pid, 0);
        if (pid > 0) EXPECT_EQ(waitpid(pid, &wstatus, 0), pid);
        return wstatus;
    }

    void write_input(const fs::path &path, const vector<json> &candidates) {
        ofstream fout(path);
        for (auto &cand : candidates) fout << cand.dump() << endl;
    }

    static json sum_candidate(const string &solution_id, const string &source) {
        return {{"problem_id", "sum_numbers"},
                {"solution_id", solution_id},
                {"generated_solution", source},
                {"public_tests", {{{"input", "1\n2"}, {"output", "3"}}}}};
    }

    static map<string, string> statuses(const fs::path &output) {
        map<string, string> result;
        for (auto &line : read_lines(output)) {
            json j = json::parse(line);
            result[j.at("solution_id").get<string>()] = j.at("status").get<string>();
        }
        return result;
    }
};

static bool exited_successfully(int wstatus) {
    return WIFEXITED(wstatus) && WEXITSTATUS(wstatus) == 0;
}

TEST_F(CommandLineTest, CompletedBatchWithFailuresExitsZero) {
    write_input(dir / "input.jsonl",
                {sum_candidate("good", "def solve(lines):\n    return int(lines[0]) + int(lines[1])\n"),
                 sum_candidate("bad", "def solve(lines):\n    return 4\n"),
                 sum_candidate("broken", "def solve(lines):\n    return (\n")});

    int wstatus = run_cli({"--input", (dir / "input.jsonl").string(), "--output", (dir / "out.jsonl").string()});
    EXPECT_TRUE(exited_successfully(wstatus));

    auto result = statuses(dir / "out.jsonl");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result["good"], "pass");
    EXPECT_EQ(result["bad"], "fail");
    EXPECT_EQ(result["broken"], "error");
}

TEST_F(CommandLineTest, RerunDoesNotDuplicateRecords) {
    write_input(dir / "input.jsonl", {sum_candidate("good", "def solve(lines):\n    return 3\n")});
    vector<string> args = {"--input", (dir / "input.jsonl").string(), "--output", (dir / "out.jsonl").string()};

    EXPECT_TRUE(exited_successfully(run_cli(args)));
    EXPECT_TRUE(exited_successfully(run_cli(args)));
    EXPECT_EQ(read_lines(dir / "out.jsonl").size(), 1u);
}

TEST_F(CommandLineTest, UnreadableInputExitsNonzero) {
    int wstatus = run_cli({"--input", (dir / "missing.jsonl").string(), "--output", (dir / "out.jsonl").string()});
    EXPECT_FALSE(exited_successfully(wstatus));
}

TEST_F(CommandLineTest, MissingRunnerExitsNonzero) {
    write_input(dir / "input.jsonl", {sum_candidate("good", "def solve(lines):\n    return 3\n")});
    int wstatus = run_cli({"--input", (dir / "input.jsonl").string(), "--output", (dir / "out.jsonl").string(),
                           "--runner", (dir / "no-such-runner").string()});
    EXPECT_FALSE(exited_successfully(wstatus));
    EXPECT_FALSE(fs::exists(dir / "out.jsonl"));
}

TEST_F(CommandLineTest, NegativeConcurrencyIsRejected) {
    write_input(dir / "input.jsonl", {sum_candidate("good", "def solve(lines):\n    return 3\n")});
    int wstatus = run_cli({"--input", (dir / "input.jsonl").string(), "--output", (dir / "out.jsonl").string(),
                           "--concurrency=-1"});
    EXPECT_FALSE(exited_successfully(wstatus));
    EXPECT_FALSE(fs::exists(dir / "out.jsonl"));
}

TEST_F(CommandLineTest, RootDirWritesResultsBesideInputs) {
    fs::create_directories(dir / "model-a");
    fs::create_directories(dir / "model-b" / "nested");
    write_input(dir / "model-a" / "generated_completions_codecontests.jsonl",
                {sum_candidate("a1", "def solve(lines):\n    return 3\n")});
    write_input(dir / "model-b" / "nested" / "generated_completions_apps.jsonl",
                {sum_candidate("b1", "def solve(lines):\n    return 5\n")});
    write_input(dir / "model-b" / "other.jsonl",
                {sum_candidate("ignored", "def solve(lines):\n    return 3\n")});

    int wstatus = run_cli({"--root-dir", dir.string()});
    EXPECT_TRUE(exited_successfully(wstatus));

    auto a = statuses(dir / "model-a" / "unittest_codecontests.jsonl");
    ASSERT_EQ(a.size(), 1u);
    EXPECT_EQ(a["a1"], "pass");

    auto b = statuses(dir / "model-b" / "nested" / "unittest_apps.jsonl");
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b["b1"], "fail");

    EXPECT_FALSE(fs::exists(dir / "model-b" / "unittest_other.jsonl"));
}

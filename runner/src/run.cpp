#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <system_error>
#include "common/io_utils.hpp"
#include "common/python.hpp"
#include "common/stl_utils.hpp"
#include "config.hpp"
#include "harness/normalize.hpp"
#include "harness/protocol.hpp"
#include "harness/test_case_builder.hpp"

using namespace std;
using namespace nlohmann;
using namespace harness;
namespace bp = boost::python;
namespace fs = std::filesystem;

/**
 * @brief 输出不一致时，期望输出与实际输出各保留的字节数
 */
static const size_t MISMATCH_TEXT_LIMIT = 1000;

/**
 * @brief traceback 保留的字节数
 */
static const size_t TRACEBACK_LIMIT = 8192;

/**
 * @brief 结果管道的写端，每条消息一次写完
 */
struct result_channel {
    explicit result_channel(int fd) : fd(fd) {
        // 选手代码创建的子进程不应该继承结果管道
        int flags = fcntl(fd, F_GETFD);
        if (flags < 0 || fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0)
            throw system_error(errno, system_category(), fmt::format("invalid result fd {}", fd));
    }

    void send(const protocol::frame &f) {
        string line = protocol::encode_frame(f);
        write_all(fd, line.data(), line.size());
    }

private:
    int fd;
};

static string quote(const string &text) {
    return json(truncate_text(text, MISMATCH_TEXT_LIMIT)).dump(-1, ' ', false, json::error_handler_t::replace);
}

static bp::list make_input_list(const string &input) {
    bp::list lines;
    for (auto &line : split_input_lines(input))
        lines.append(bp::object(bp::handle<>(PyUnicode_DecodeUTF8(line.data(), line.size(), "replace"))));
    return lines;
}

static string traceback_text() {
    return truncate_text(fetch_python_exception(), TRACEBACK_LIMIT);
}

/**
 * @brief 执行一个测试点
 */
static protocol::frame run_test(const bp::object &solve, size_t index, const string &input, const string &expected) {
    string actual;
    try {
        bp::object ret = solve(make_input_list(input));
        actual = py_to_string(bp::str(ret));
    } catch (bp::error_already_set &) {
        return protocol::make_test(index, false, failure_kind::CANDIDATE_RAISED, traceback_text());
    }

    if (outputs_equal(actual, expected))
        return protocol::make_test(index, true, failure_kind::NONE, nullopt);

    return protocol::make_test(index, false, failure_kind::ASSERTION_FAILURE,
                               fmt::format("test {}: output mismatch: expected {} but got {}",
                                           index, quote(normalize_output(expected)), quote(normalize_output(actual))));
}

/**
 * @brief 编译并执行选手代码，返回模块的全局命名空间
 * @return 加载失败时返回 None，并已经通过 channel 发送 load_error
 */
static bp::object load_solution(result_channel &channel, const fs::path &source_file, const string &source) {
    bp::object builtins = bp::import("builtins");
    bp::dict globals;
    globals["__name__"] = "solution";
    globals["__file__"] = source_file.string();
    globals["__builtins__"] = builtins;

    // 以 bytes 编译，源代码的编码声明与解码错误都交给 Python 处理
    bp::object code_bytes{bp::handle<>(PyBytes_FromStringAndSize(source.data(), source.size()))};
    try {
        bp::object code = builtins.attr("compile")(code_bytes, source_file.string(), "exec");
        builtins.attr("exec")(code, globals);
    } catch (bp::error_already_set &) {
        channel.send(protocol::make_load_error(failure_kind::CANDIDATE_RAISED, traceback_text()));
        return bp::object();
    }
    return globals;
}

static int report_fatal(result_channel &channel, const string &message) {
    LOG(ERROR) << "harness-runner failed: " << message;
    try {
        channel.send(protocol::make_fatal(truncate_text(message, TRACEBACK_LIMIT)));
    } catch (system_error &write_error) {
        LOG(ERROR) << "Unable to report fatal error: " << write_error.what();
    }
    return E_INTERNAL_ERROR;
}

int run_tests(const runner_options &opt) {
    unique_ptr<result_channel> channel;
    try {
        channel = make_unique<result_channel>(opt.result_fd);
    } catch (system_error &ex) {
        LOG(ERROR) << ex.what();
        return E_INTERNAL_ERROR;
    }

    try {
        json data = json::parse(read_file_content(opt.tests_file));
        string entry_point = data.value("entry_point", string(ENTRY_POINT));
        const json &tests = data.at("tests");
        string source = read_file_content(opt.source_file);
        fs::path source_file = fs::absolute(opt.source_file);

        python_interpreter interpreter;
        bp::import("sys").attr("path").attr("insert")(0, source_file.parent_path().string());

        bp::object globals = load_solution(*channel, source_file, source);
        if (globals.is_none()) {
            LOG(INFO) << "Candidate failed to load";
            return E_SUCCESS;
        }

        // 先取出 solve，选手代码可能在执行过程中删除或替换全局的 solve
        bp::object solve = globals.attr("get")(entry_point);
        if (solve.is_none() || !PyCallable_Check(solve.ptr())) {
            channel->send(protocol::make_load_error(failure_kind::MISSING_ENTRY_POINT,
                                                    truncate_text(fmt::format("missing entry point: '{}' is not a callable defined by the module", entry_point), TRACEBACK_LIMIT)));
            return E_SUCCESS;
        }

        channel->send(protocol::make_loaded());
        for (size_t i = 0; i < tests.size(); ++i) {
            const json &test = tests.at(i);
            protocol::frame result = run_test(solve, i, test.at("input").get<string>(), test.at("output").get<string>());
            interpreter.flush_streams();
            channel->send(result);
        }
        channel->send(protocol::make_done());
        return E_SUCCESS;
    } catch (bp::error_already_set &) {
        return report_fatal(*channel, "python error: " + fetch_python_exception());
    } catch (exception &ex) {
        return report_fatal(*channel, ex.what());
    }
}

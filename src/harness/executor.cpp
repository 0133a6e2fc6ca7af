#include "harness/executor.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <climits>
#include <cmath>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "harness/protocol.hpp"

extern char **environ;

namespace harness {
using namespace std;
namespace fs = std::filesystem;

/**
 * @brief 结果管道中单行消息的最大长度
 */
static const size_t MAX_FRAME_SIZE = 1 << 20;

/**
 * @brief 发送 SIGTERM 之后等待多久再发送 SIGKILL
 */
static const struct timespec killdelay = {0, 100000000L};  // 0.1s

/**
 * @brief 子进程关闭结果管道后轮询 waitpid 的间隔，单位为微秒
 */
static const useconds_t reap_interval = 10000;

/**
 * @brief 时间限制超过该值（秒）时不再设置 RLIMIT_CPU
 */
static const double MAX_CPU_LIMIT = 1e9;

execution_limits execution_limits::from_config() {
    execution_limits limits;
    limits.time_limit = TIME_LIMIT;
    limits.memory_limit = MEMORY_LIMIT;
    limits.file_limit = FILE_LIMIT;
    limits.output_limit = OUTPUT_LIMIT;
    return limits;
}

executor::~executor() = default;

static test_result to_test_result(const protocol::frame &f) {
    test_result result;
    result.index = f.index;
    result.passed = f.passed;
    result.kind = f.kind;
    result.detail = f.detail;
    return result;
}

/**
 * @brief 超时时尽量取出已经完成的测试点结果，遇到无法解析的消息就停止
 */
static vector<test_result> partial_tests(const child_report &report, size_t num_tests) {
    vector<test_result> tests;
    for (auto &line : report.lines) {
        try {
            protocol::frame f = protocol::decode_frame(line);
            if (f.type != protocol::frame_type::TEST) continue;
            if (f.index != tests.size() || f.index >= num_tests) break;
            tests.push_back(to_test_result(f));
        } catch (transport_error &ex) {
            break;
        }
    }
    return tests;
}

static string describe_termination(const child_report &report) {
    if (report.signal != 0)
        return fmt::format("terminated by signal {} ({})", report.signal, strsignal(report.signal));
    return fmt::format("exited with status {}", report.exit_code);
}

execution_outcome classify(const child_report &report, size_t num_tests, double time_limit) {
    if (report.timed_out) {
        execution_outcome outcome = make_outcome(failure_kind::TIMEOUT, num_tests,
                                                 fmt::format("Execution timed out after {:g} seconds", time_limit),
                                                 time_limit);
        outcome.tests = partial_tests(report, num_tests);
        return outcome;
    }

    vector<test_result> tests;
    optional<protocol::frame> terminal;
    bool loaded = false;
    try {
        if (report.channel_error)
            throw transport_error(*report.channel_error);

        for (auto &line : report.lines) {
            protocol::frame f = protocol::decode_frame(line);
            if (terminal)
                throw transport_error("unexpected frame after " + line);

            switch (f.type) {
                case protocol::frame_type::LOADED:
                    if (loaded) throw transport_error("duplicate loaded frame");
                    loaded = true;
                    break;
                case protocol::frame_type::LOAD_ERROR:
                    if (loaded) throw transport_error("load_error frame after loaded frame");
                    if (f.kind != failure_kind::CANDIDATE_RAISED && f.kind != failure_kind::MISSING_ENTRY_POINT)
                        throw transport_error(fmt::format("unexpected load_error kind {}", to_string(f.kind)));
                    terminal = f;
                    break;
                case protocol::frame_type::TEST:
                    if (!loaded) throw transport_error("test frame before loaded frame");
                    if (f.index != tests.size() || f.index >= num_tests)
                        throw transport_error(fmt::format("unexpected test index {}, expecting {}", f.index, tests.size()));
                    tests.push_back(to_test_result(f));
                    break;
                case protocol::frame_type::DONE:
                    if (!loaded) throw transport_error("done frame before loaded frame");
                    terminal = f;
                    break;
                case protocol::frame_type::FATAL:
                    terminal = f;
                    break;
            }
        }
    } catch (transport_error &ex) {
        execution_outcome outcome = make_outcome(failure_kind::TRANSPORT_ERROR, num_tests,
                                                 string("invalid result channel: ") + ex.what(),
                                                 report.elapsed_seconds);
        outcome.tests = move(tests);
        return outcome;
    }

    execution_outcome outcome;
    bool abnormal_exit = report.signal != 0 || report.exit_code != 0;
    if (!terminal) {
        outcome = make_outcome(failure_kind::CHILD_CRASHED, num_tests,
                               fmt::format("Child process {} before reporting results{}", describe_termination(report),
                                           report.incomplete_line ? ", last result frame is incomplete" : ""));
        outcome.tests = move(tests);
    } else if (terminal->type == protocol::frame_type::FATAL) {
        outcome = make_outcome(failure_kind::HARNESS_INTERNAL_ERROR, num_tests, "harness runner failed: " + terminal->message);
    } else if (terminal->type == protocol::frame_type::LOAD_ERROR) {
        outcome = make_outcome(terminal->kind, num_tests, terminal->message);
    } else if (abnormal_exit) {
        outcome = make_outcome(failure_kind::CHILD_CRASHED, num_tests,
                               fmt::format("Child process {} after reporting results", describe_termination(report)));
        outcome.tests = move(tests);
    } else if (tests.size() != num_tests) {
        outcome = make_outcome(failure_kind::TRANSPORT_ERROR, num_tests,
                               fmt::format("invalid result channel: expecting {} test results, got {}", num_tests, tests.size()));
        outcome.tests = move(tests);
    } else {
        outcome = summarize_tests(move(tests), num_tests);
    }
    outcome.elapsed_seconds = report.elapsed_seconds;
    return outcome;
}

process_executor::process_executor(fs::path runner_path) : runner_path(move(runner_path)) {}

execution_outcome process_executor::execute(const test_artifact &artifact, const execution_limits &limits) {
    child_report report;
    try {
        report = run_child(artifact, limits);
    } catch (exception &ex) {
        LOG(ERROR) << "Unable to run child process in " << artifact.work_dir << ": " << ex.what();
        return make_outcome(failure_kind::HARNESS_INTERNAL_ERROR, artifact.num_tests,
                            string("unable to run child process: ") + ex.what());
    }

    execution_outcome outcome = classify(report, artifact.num_tests, limits.time_limit);

    bool truncated = false;
    outcome.stdout_text = read_file_prefix(artifact.stdout_file(), limits.output_limit, truncated);
    if (truncated)
        DLOG(INFO) << "stdout of " << artifact.work_dir << " truncated to " << limits.output_limit << " bytes";
    return outcome;
}

static void set_rlimit(int resource, rlim_t limit) {
    struct rlimit lim;
    lim.rlim_cur = lim.rlim_max = limit;
    // 子进程中只能调用异步信号安全的函数，失败时直接退出
    if (setrlimit(resource, &lim) != 0) _exit(127);
}

/**
 * @brief 将 fd 复制为 target，二者相同时清除 FD_CLOEXEC
 */
static void redirect(int fd, int target) {
    if (fd == target) {
        int flags = fcntl(fd, F_GETFD);
        if (flags < 0 || fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) < 0) _exit(127);
    } else if (dup2(fd, target) < 0) {
        _exit(127);
    }
}

/**
 * @brief fork 之后在子进程中执行，不会返回
 * 父进程可能是多线程的，这里只能调用异步信号安全的函数，所有参数都在 fork 前准备好
 */
[[noreturn]] static void exec_child(char *const argv[], char *const envp[], const char *work_dir,
                                    int stdin_fd, int stdout_fd, int stderr_fd, int result_fd,
                                    const execution_limits &limits) {
    // 独立的进程组，以便超时时杀死候选解创建的所有子进程
    setpgid(0, 0);

    redirect(stdin_fd, STDIN_FILENO);
    redirect(stdout_fd, STDOUT_FILENO);
    redirect(stderr_fd, STDERR_FILENO);
    redirect(result_fd, 3);

    sigset_t mask;
    sigemptyset(&mask);
    sigprocmask(SIG_SETMASK, &mask, nullptr);

    if (limits.memory_limit > 0)
        set_rlimit(RLIMIT_AS, (rlim_t)limits.memory_limit * 1024);
    if (limits.file_limit > 0)
        set_rlimit(RLIMIT_FSIZE, (rlim_t)limits.file_limit * 1024);
    // CPU 时间限制只是兜底，时钟时间限制由父进程负责
    set_rlimit(RLIMIT_CPU, limits.time_limit < MAX_CPU_LIMIT ? (rlim_t)ceil(limits.time_limit) + 1 : RLIM_INFINITY);
    set_rlimit(RLIMIT_CORE, 0);

    if (chdir(work_dir) != 0) _exit(127);

    execve(argv[0], argv, envp);
    _exit(127);
}

/**
 * @brief 杀死子进程所在的进程组并回收子进程
 * 先发送 SIGTERM，等待 killdelay 后发送 SIGKILL
 */
static int terminate_group(pid_t pid) {
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
        PLOG(WARNING) << "unable to send SIGTERM to process group " << pid;
    nanosleep(&killdelay, nullptr);
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        PLOG(WARNING) << "unable to send SIGKILL to process group " << pid;

    int wstatus = 0;
    while (waitpid(pid, &wstatus, 0) < 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), "waitpid");
    }
    return wstatus;
}

/**
 * @brief poll 的超时时间，单位为毫秒
 */
static int poll_timeout(double remaining) {
    double ms = ceil(remaining * 1000);
    return ms >= INT_MAX ? INT_MAX : (int)ms;
}

/**
 * @brief 是否是结果协议的最后一条消息，此后子进程不应再发送任何消息
 * 无法解析的消息也视为结束，由 classify 报告 TRANSPORT_ERROR
 */
static bool is_terminal_frame(const string &line) {
    try {
        protocol::frame_type type = protocol::decode_frame(line).type;
        return type == protocol::frame_type::DONE ||
               type == protocol::frame_type::LOAD_ERROR ||
               type == protocol::frame_type::FATAL;
    } catch (transport_error &ex) {
        return true;
    }
}

static int open_file(const fs::path &path, int flags) {
    int fd = open(path.c_str(), flags | O_CLOEXEC, 0644);
    if (fd < 0) throw system_error(errno, system_category(), "unable to open " + path.string());
    return fd;
}

child_report process_executor::run_child(const test_artifact &artifact, const execution_limits &limits) {
    vector<string> args = {runner_path.string(),
                           "--source", artifact.source_file().string(),
                           "--tests", artifact.tests_file().string(),
                           "--result-fd", "3"};
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    vector<string> envs = {"PYTHONDONTWRITEBYTECODE=1", "PYTHONIOENCODING=utf-8"};
    vector<char *> envp;
    for (auto &env : envs) envp.push_back(const_cast<char *>(env.c_str()));
    for (char **env = environ; *env; ++env) {
        if (strncmp(*env, "PYTHONDONTWRITEBYTECODE=", 24) == 0 || strncmp(*env, "PYTHONIOENCODING=", 17) == 0)
            continue;
        envp.push_back(*env);
    }
    envp.push_back(nullptr);

    string work_dir = artifact.work_dir.string();

    file_descriptor stdin_fd(open_file("/dev/null", O_RDONLY));
    file_descriptor stdout_fd(open_file(artifact.stdout_file(), O_WRONLY | O_CREAT | O_TRUNC));
    file_descriptor stderr_fd(open_file(artifact.stderr_file(), O_WRONLY | O_CREAT | O_TRUNC));

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "unable to create result pipe");
    file_descriptor result_read(pipefd[0]), result_write(pipefd[1]);

    child_report report;
    elapsed_time timer;

    pid_t pid = fork();
    if (pid < 0) throw system_error(errno, system_category(), "unable to fork");
    if (pid == 0) {
        exec_child(argv.data(), envp.data(), work_dir.c_str(),
                   stdin_fd.get(), stdout_fd.get(), stderr_fd.get(), result_write.get(), limits);
    }

    // 父进程也设置一次，避免子进程还没有调用 setpgid 时就需要杀死进程组
    setpgid(pid, pid);

    bool reaped = false;
    defer {
        if (!reaped) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            int wstatus;
            while (waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {}
        }
    };

    result_write.reset();
    stdin_fd.reset();
    stdout_fd.reset();
    stderr_fd.reset();

    string buffer;
    char buf[4096];
    bool eof = false, finished = false;
    while (!eof && !finished && !report.channel_error) {
        double remaining = limits.time_limit - timer.seconds();
        if (remaining <= 0) {
            report.timed_out = true;
            break;
        }

        struct pollfd pfd = {result_read.get(), POLLIN, 0};
        int r = poll(&pfd, 1, poll_timeout(remaining));
        if (r < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "poll");
        }
        if (r == 0) continue;

        ssize_t nread = read(result_read.get(), buf, sizeof(buf));
        if (nread < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            report.channel_error = fmt::format("unable to read result pipe: {}", strerror(errno));
        } else if (nread == 0) {
            eof = true;
        } else {
            buffer.append(buf, nread);
            size_t start = 0, pos;
            while ((pos = buffer.find('\n', start)) != string::npos) {
                report.lines.push_back(buffer.substr(start, pos - start));
                start = pos + 1;
                if (is_terminal_frame(report.lines.back())) finished = true;
            }
            buffer.erase(0, start);
            if (!finished && buffer.size() > MAX_FRAME_SIZE)
                report.channel_error = fmt::format("frame exceeds {} bytes", MAX_FRAME_SIZE);
        }
    }
    report.incomplete_line = !finished && !buffer.empty();

    int wstatus = 0;
    if (eof || finished) {
        // 候选解 fork 出的进程可能继承了结果管道，因此收到终止消息后不再等待管道关闭，
        // 只等待 harness-runner 退出，但仍然受时间限制约束
        while (true) {
            pid_t ret = waitpid(pid, &wstatus, WNOHANG);
            if (ret < 0) {
                if (errno == EINTR) continue;
                throw system_error(errno, system_category(), "waitpid");
            }
            if (ret == pid) {
                reaped = true;
                break;
            }
            if (timer.seconds() >= limits.time_limit) {
                report.timed_out = true;
                break;
            }
            usleep(reap_interval);
        }
    }

    if (!reaped) {
        if (report.timed_out)
            LOG(INFO) << "Child process " << pid << " timed out after " << limits.time_limit << " seconds, killing";
        wstatus = terminate_group(pid);
        reaped = true;
    } else if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        // 候选解创建的子进程可能还在运行
        PLOG(WARNING) << "unable to kill process group " << pid;
    }

    report.elapsed_seconds = timer.seconds();
    if (WIFEXITED(wstatus)) {
        report.exit_code = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        report.signal = WTERMSIG(wstatus);
    }

    if (report.exit_code == 127 && report.lines.empty())
        LOG(WARNING) << "Child process exited with 127, check whether runner " << runner_path << " is executable";
    return report;
}

}  // namespace harness

#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include "common/utils.hpp"
#include "config.hpp"
#include "harness/batch_runner.hpp"
#include "harness/input_loader.hpp"
#include "worker.hpp"
using namespace std;

static const string INPUT_PREFIX = "generated_completions_";
static const string OUTPUT_PREFIX = "unittest_";

/**
 * @brief 同时评测的候选解个数上限，每个候选解占用一个线程和一个子进程
 */
static const long long MAX_CONCURRENCY = 1024;

void stopHandler(int /* signum */) {
    // 正在评测的任务会继续完成并写入结果文件
    harness::stop_workers();
}

/**
 * @brief 在 root 下递归查找 generated_completions_*.jsonl，结果文件为同目录下的 unittest_*.jsonl
 */
static vector<pair<filesystem::path, filesystem::path>> discover_inputs(const filesystem::path& root) {
    vector<pair<filesystem::path, filesystem::path>> files;
    for (auto& entry : filesystem::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        string name = entry.path().filename().string();
        if (!boost::starts_with(name, INPUT_PREFIX) || !boost::ends_with(name, ".jsonl")) continue;
        filesystem::path output = entry.path().parent_path() / (OUTPUT_PREFIX + name.substr(INPUT_PREFIX.size()));
        files.emplace_back(entry.path(), output);
    }
    sort(files.begin(), files.end());
    return files;
}

/**
 * @brief 评测一个输入文件
 * @return 是否评测完了所有候选解
 */
static bool evaluate_file(const filesystem::path& input, const filesystem::path& output, bool resume) {
    LOG(INFO) << "Evaluating " << input << " into " << output;

    harness::load_result loaded = harness::load_candidates(input);
    harness::result_store store(output, resume);
    harness::process_executor exec(harness::RUNNER_PATH);

    harness::batch_options options;
    options.concurrency = harness::CONCURRENCY;
    options.limits = harness::execution_limits::from_config();

    harness::batch_runner runner(harness::test_case_builder(harness::RUN_DIR), exec, store, options);
    harness::batch_summary summary = runner.run(loaded.tasks);

    cout << input.string() << ": " << summary.executed << " executed, "
         << summary.already_processed << " already processed, "
         << summary.duplicates << " duplicates, "
         << loaded.skipped << " malformed lines skipped" << endl;
    for (auto& [st, count] : summary.tally)
        cout << "  " << harness::to_string(st) << ": " << count << endl;
    return !summary.interrupted;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    filesystem::path current(argv[0]);
    filesystem::path bin_dir(filesystem::weakly_canonical(current).parent_path());

    signal(SIGINT, stopHandler);
    signal(SIGTERM, stopHandler);

    namespace po = boost::program_options;
    po::options_description desc("harness options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("input,i", po::value<string>(), "JSONL file of generated candidate solutions")
        ("output,o", po::value<string>()->default_value("unit_test_results.jsonl"), "JSONL file to append result records to")
        ("root-dir", po::value<string>(), "evaluate every generated_completions_*.jsonl below the directory, writing unittest_*.jsonl beside each of them")
        ("concurrency,j", po::value<long long>(), "set the number of candidates evaluated simultaneously, default to 1. You can either pass it from environ CONCURRENCY")
        ("timeout,t", po::value<double>(), "set time limit in seconds for all tests of a candidate, default to 10. You can either pass it from environ TIMELIMIT")
        ("memory-limit", po::value<long long>(), "set address space limit in KB for a candidate, default to 1048576(1GB). You can either pass it from environ MEMLIMIT")
        ("file-limit", po::value<long long>(), "set file size limit in KB for a candidate, default to 65536(64MB). You can either pass it from environ FILELIMIT")
        ("output-limit", po::value<long long>(), "set the number of bytes of stdout kept in result records, default to 65536. You can either pass it from environ OUTPUTLIMIT")
        ("runner", po::value<string>(), "set the path of harness-runner. You can either pass it from environ RUNNER")
        ("run-dir", po::value<string>(), "set the directory to create work directories of candidates in. You can either pass it from environ RUNDIR")
        ("no-resume", "discard existing result records instead of skipping the candidates they cover")
        ("debug", "turn on the debug mode to keep work directories of candidates for inspection. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "harness: Evaluate generated Python solutions against the public tests of their problems" << endl
             << "Usage: " << argv[0] << " --input generated.jsonl [--output results.jsonl] [options]" << endl
             << "       " << argv[0] << " --root-dir DIR [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "harness 1.0" << endl;
        return EXIT_SUCCESS;
    }

    try {
        if (vm.count("debug") || getenv("DEBUG")) {
            harness::DEBUG = true;
        }

        // 按有符号数解析，避免负数被转换为巨大的无符号数
        long long concurrency = vm.count("concurrency")
                                    ? vm["concurrency"].as<long long>()
                                    : get_env_as<long long>("CONCURRENCY", (long long)harness::CONCURRENCY);
        CHECK(concurrency > 0 && concurrency <= MAX_CONCURRENCY)
            << "Concurrency should be between 1 and " << MAX_CONCURRENCY;
        harness::CONCURRENCY = (size_t)concurrency;

        if (vm.count("timeout")) {
            harness::TIME_LIMIT = vm["timeout"].as<double>();
        } else {
            harness::TIME_LIMIT = get_env_as<double>("TIMELIMIT", harness::TIME_LIMIT);
        }
        CHECK(harness::TIME_LIMIT > 0 && isfinite(harness::TIME_LIMIT)) << "Time limit should be a positive number";

        if (vm.count("memory-limit")) {
            harness::MEMORY_LIMIT = vm["memory-limit"].as<long long>();
        } else {
            harness::MEMORY_LIMIT = get_env_as<long long>("MEMLIMIT", harness::MEMORY_LIMIT);
        }

        if (vm.count("file-limit")) {
            harness::FILE_LIMIT = vm["file-limit"].as<long long>();
        } else {
            harness::FILE_LIMIT = get_env_as<long long>("FILELIMIT", harness::FILE_LIMIT);
        }

        long long output_limit = vm.count("output-limit")
                                     ? vm["output-limit"].as<long long>()
                                     : get_env_as<long long>("OUTPUTLIMIT", (long long)harness::OUTPUT_LIMIT);
        CHECK(output_limit >= 0) << "Output limit should not be negative";
        harness::OUTPUT_LIMIT = (size_t)output_limit;
    } catch (boost::bad_lexical_cast& e) {
        cerr << "Malformed environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    // 默认情况下，假设 harness-runner 与 harness 编译到同一个目录
    if (vm.count("runner")) {
        harness::RUNNER_PATH = filesystem::path(vm.at("runner").as<string>());
    } else if (getenv("RUNNER")) {
        harness::RUNNER_PATH = filesystem::path(getenv("RUNNER"));
    } else {
        harness::RUNNER_PATH = bin_dir / "harness-runner";
    }
    harness::RUNNER_PATH = filesystem::absolute(harness::RUNNER_PATH);
    CHECK(access(harness::RUNNER_PATH.c_str(), X_OK) == 0)
        << "Runner " << harness::RUNNER_PATH << " is not executable. Use --runner or environ RUNNER to point out where harness-runner locates in.";

    if (vm.count("run-dir")) {
        harness::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        harness::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    harness::RUN_DIR = filesystem::absolute(harness::RUN_DIR);
    error_code ec;
    filesystem::create_directories(harness::RUN_DIR, ec);
    CHECK(filesystem::is_directory(harness::RUN_DIR))
        << "Run directory " << harness::RUN_DIR << " cannot be created: " << ec.message();

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    vector<pair<filesystem::path, filesystem::path>> files;
    if (vm.count("root-dir")) {
        filesystem::path root(vm.at("root-dir").as<string>());
        CHECK(filesystem::is_directory(root)) << "Root directory " << root << " does not exist";
        files = discover_inputs(root);
        if (files.empty()) LOG(WARNING) << "No " << INPUT_PREFIX << "*.jsonl found in " << root;
    } else if (vm.count("input")) {
        files.emplace_back(vm.at("input").as<string>(), vm.at("output").as<string>());
    } else {
        cerr << "Either --input or --root-dir should be specified" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    bool resume = !vm.count("no-resume");
    bool completed = true;
    for (auto& [input, output] : files) {
        if (harness::workers_stopped()) {
            completed = false;
            break;
        }
        try {
            completed = evaluate_file(input, output, resume) && completed;
        } catch (std::exception& e) {
            LOG(ERROR) << "Unable to evaluate " << input << endl
                       << boost::diagnostic_information(e);
            return EXIT_FAILURE;
        }
    }

    if (!completed) {
        LOG(WARNING) << "Interrupted before all candidates were evaluated, rerun to resume";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <iostream>
#include "config.hpp"
#include "run.hpp"

using namespace std;

int main(int argc, const char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("harness-runner options");
    po::variables_map vm;

    runner_options opt;

    // clang-format off
    desc.add_options()
        ("source,s", po::value<string>(&opt.source_file)->required(), "python source file of the candidate solution")
        ("tests,t", po::value<string>(&opt.tests_file)->required(), "json file containing test inputs and expected outputs")
        ("result-fd,r", po::value<int>(&opt.result_fd)->default_value(3), "file descriptor to write result frames to")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            cout << "harness-runner: Run a candidate solution against its tests inside a child process of harness." << endl
                 << "Usage: " << argv[0] << " --source solution.py --tests tests.json [--result-fd 3]" << endl;
            cout << desc << endl;
            return harness::E_SUCCESS;
        }
        if (vm.count("version")) {
            cout << "harness-runner" << endl;
            return harness::E_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return harness::E_INTERNAL_ERROR;
    }

    return run_tests(opt);
}

#pragma once

#include <string>

struct runner_options {
    std::string source_file;  // 选手代码
    std::string tests_file;   // 测试数据，格式见 test_case_builder
    int result_fd = 3;        // 结果管道
};

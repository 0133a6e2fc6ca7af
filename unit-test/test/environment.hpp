#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "harness/problem.hpp"

/**
 * 测试用的辅助函数
 * 用法：
 * 1. 在 SetUpTestCase 中调用 setup_test_environment()
 * 2. 通过 make_problem、make_task 构造评测任务
 * 3. 用 process_executor(harness::RUNNER_PATH) 或 mock executor 评测
 */
namespace harness {

/**
 * @brief 设置测试所需的全局配置
 * RUNNER_PATH 优先使用环境变量 HARNESS_RUNNER，否则使用编译时传入的 harness-runner 路径；
 * RUN_DIR 为系统临时目录下的 harness-test
 */
void setup_test_environment();

/**
 * @brief 创建一个空的临时目录，用于存放结果文件
 */
std::filesystem::path make_temp_dir(const std::string &name);

std::shared_ptr<const problem> make_problem(const std::string &id, const std::vector<test_case> &tests);

evaluation_task make_task(std::shared_ptr<const problem> prob, const std::string &solution_id, const std::string &source);

/**
 * @brief 读取 JSONL 文件中的所有非空行
 */
std::vector<std::string> read_lines(const std::filesystem::path &path);

}  // namespace harness

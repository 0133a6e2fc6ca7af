#pragma once

#include <filesystem>
#include <istream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "harness/problem.hpp"

namespace harness {

/**
 * @brief 读取输入文件的结果
 */
struct load_result {
    /**
     * @brief 按输入文件顺序排列的评测任务
     * 同一道题的所有任务共享同一个 problem 对象
     */
    std::vector<evaluation_task> tasks;

    /**
     * @brief 因格式错误被跳过的行数
     */
    std::size_t skipped = 0;
};

/**
 * @brief 解析 public_tests 字段
 * 支持两种格式：
 * 1. [{"input": "...", "output": "..."}, ...]
 * 2. {"input": ["...", ...], "output": ["...", ...]}，按下标配对，两侧都去掉首尾空白，
 *    较长一侧多出的部分被丢弃
 * null 视为没有测试点
 * @throw std::invalid_argument 若格式不符合以上任何一种
 */
std::vector<test_case> parse_public_tests(const nlohmann::json &tests);

/**
 * @brief 从 JSONL 输入中读取候选解
 * 1. 空行被忽略
 * 2. 不是合法 JSON、缺少 problem_id、缺少 solution_id 且缺少 completion_index、
 *    generated_solution 不是字符串、public_tests 格式错误的行被跳过，并输出带行号的警告
 * 3. 同一个 problem_id 的题面和测试点以第一次出现的行为准
 * 4. 除 problem_id、solution_id、generated_solution、public_tests 以外的字段作为元数据
 * @param source_name 用于日志的输入名称
 */
load_result load_candidates(std::istream &in, const std::string &source_name);

/**
 * @throw std::system_error 若文件无法打开
 */
load_result load_candidates(const std::filesystem::path &path);

}  // namespace harness

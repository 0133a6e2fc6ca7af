#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * 这个头文件包含评测输入的数据模型
 * 包含：
 * 1. test_case 类（表示一组样例输入输出）
 * 2. problem 类（表示一道题）
 * 3. candidate 类（表示模型生成的一个候选解）
 * 4. evaluation_task 类（表示一个待评测的 (题目, 候选解) 对）
 */
namespace harness {

/**
 * @brief 一组样例测试
 * 输入和期望输出都以文本表示，比较前会经过 normalize_output 的规范化
 */
struct test_case {
    std::string input;
    std::string output;
};

/**
 * @brief 一道题目，加载后不再修改
 */
struct problem {
    /**
     * @brief 题目 id，在输入文件中唯一标识一道题
     */
    std::string id;

    /**
     * @brief 题面，评测时不使用
     */
    std::string description;

    /**
     * @brief 公开样例，按输入文件中的顺序排列
     * 顺序只影响结果记录中的下标，不影响正确性
     */
    std::vector<test_case> public_tests;
};

/**
 * @brief 模型生成的一个候选解
 */
struct candidate {
    std::string problem_id;

    /**
     * @brief 候选解 id，在同一道题内唯一
     */
    std::string solution_id;

    /**
     * @brief 候选解源代码（Python）
     */
    std::string source;

    /**
     * @brief 生成阶段附带的元数据（model、temperature 等）
     * 评测时不解释这些字段，原样写入结果记录
     */
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief 一个待评测的 (题目, 候选解) 对
 */
struct evaluation_task {
    std::shared_ptr<const problem> prob;

    candidate cand;

    /**
     * @brief 该任务在输入文件中的行号（从 1 开始），用于日志
     */
    std::size_t line = 0;
};

}  // namespace harness

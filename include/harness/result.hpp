#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "harness/problem.hpp"

namespace harness {

/**
 * @brief 一个测试点的评测结果
 */
struct test_result {
    /**
     * @brief 测试点下标，是 problem.public_tests 的下标
     */
    std::size_t index = 0;

    bool passed = false;

    /**
     * @brief 未通过的原因
     * ASSERTION_FAILURE 时为期望输出与实际输出的对比，
     * CANDIDATE_RAISED 时为 Python 的 traceback，通过时为空
     */
    failure_kind kind = failure_kind::NONE;

    std::optional<std::string> detail;
};

/**
 * @brief 一次执行的评测结果
 * 由 executor 在子进程正常结束或被强制终止后生成，之后不再修改。
 */
struct execution_outcome {
    harness::status status = harness::status::ERROR;

    failure_kind kind = failure_kind::HARNESS_INTERNAL_ERROR;

    /**
     * @brief 题目的测试点总数
     */
    std::size_t num_tests = 0;

    /**
     * @brief 按下标排列的测试点结果
     * 加载失败时为空；超时或崩溃时只包含终止前已经收到的结果
     */
    std::vector<test_result> tests;

    /**
     * @brief 错误信息，比如 traceback、崩溃的信号，通过时为空
     */
    std::optional<std::string> error_message;

    /**
     * @brief 子进程的 stdout 输出（至多 OUTPUT_LIMIT 字节）
     */
    std::string stdout_text;

    /**
     * @brief 执行用时，单位为秒
     * 超时时记为时间限制本身
     */
    double elapsed_seconds = 0;
};

/**
 * @brief 构造一个没有测试点结果的评测结果
 * status 由 kind 决定
 */
execution_outcome make_outcome(failure_kind kind, std::size_t num_tests, std::optional<std::string> error_message, double elapsed_seconds = 0);

/**
 * @brief 根据每个测试点的结果汇总评测结果
 * 有测试点抛出异常时为 ERROR，否则有测试点输出不一致时为 FAIL，否则为 PASS
 * @param tests 完整的测试点结果，个数必须等于测试点总数
 */
execution_outcome summarize_tests(std::vector<test_result> tests, std::size_t num_tests);

/**
 * @brief 一个 (题目, 候选解) 对的评测记录
 * 每个 (problem_id, solution_id) 在结果文件中恰好写入一次
 */
struct result_record {
    std::string problem_id;
    std::string solution_id;
    execution_outcome outcome;

    /**
     * @brief 候选解附带的元数据，原样写入结果文件
     */
    nlohmann::json metadata = nlohmann::json::object();
};

result_record make_record(const candidate &cand, execution_outcome outcome);

void to_json(nlohmann::json &j, const test_result &result);

void from_json(const nlohmann::json &j, test_result &result);

/**
 * @brief 序列化为结果文件中的一行
 * 元数据字段先写入，固定字段会覆盖同名的元数据字段
 */
void to_json(nlohmann::json &j, const result_record &record);

void from_json(const nlohmann::json &j, result_record &record);

}  // namespace harness

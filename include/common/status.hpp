#pragma once

#include <string>

namespace harness {

/**
 * @brief 表示一次执行（一个候选解在一道题的全部测试上）的评测结果
 * 写入结果文件时使用小写名称：pass、fail、error、timeout、crashed
 */
enum class status {
    /**
     * @brief 所有测试点的输出都与期望输出一致
     * 没有测试点的题目也视为通过，此时 failure_kind 为 NO_TESTS
     */
    PASS = 0,

    /**
     * @brief 至少一个测试点输出不一致，且没有测试点在选手代码中抛出异常
     */
    FAIL = 1,

    /**
     * @brief 选手代码无法加载（语法错误、缺少入口函数）、运行时抛出异常，
     * 或者评测框架自身出错、结果无法从子进程传回
     */
    ERROR = 2,

    /**
     * @brief 子进程没有在时间限制内完成，被强制终止
     */
    TIMEOUT = 3,

    /**
     * @brief 子进程在完成结果协议之前异常退出
     * 比如被信号杀死（段错误）、选手代码调用 os._exit
     */
    CRASHED = 4
};

/**
 * @brief 细分的失败原因，和 status 一起写入结果文件的 kind 字段
 * 下游统计正确率时不能把 TIMEOUT、CHILD_CRASHED、TRANSPORT_ERROR 当作答案错误
 */
enum class failure_kind {
    NONE = 0,               // 全部通过
    NO_TESTS = 1,           // 题目没有测试点，直接视为通过
    MISSING_ENTRY_POINT = 2,  // 选手代码没有定义 solve 函数
    ASSERTION_FAILURE = 3,  // 输出与期望输出不一致
    CANDIDATE_RAISED = 4,   // 选手代码加载或运行时抛出异常
    TIMEOUT = 5,            // 超出时间限制
    CHILD_CRASHED = 6,      // 子进程异常退出
    TRANSPORT_ERROR = 7,    // 子进程的结果无法解析
    HARNESS_INTERNAL_ERROR = 8  // 评测框架自身出错
};

const char *to_string(status);

const char *to_string(failure_kind);

/**
 * @brief 根据写入结果文件的名称解析 status
 * @throw std::invalid_argument 若名称不合法
 */
status parse_status(const std::string &name);

/**
 * @brief 根据写入结果文件的名称解析 failure_kind
 * @throw std::invalid_argument 若名称不合法
 */
failure_kind parse_failure_kind(const std::string &name);

/**
 * @brief 失败原因对应的评测结果
 */
status status_of(failure_kind kind);

}  // namespace harness

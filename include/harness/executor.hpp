#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "harness/result.hpp"
#include "harness/test_case_builder.hpp"

namespace harness {

/**
 * @brief 一次执行的资源限制
 */
struct execution_limits {
    /**
     * @brief 全部测试点的时钟时间限制，单位为秒
     */
    double time_limit = 10;

    /**
     * @brief 地址空间限制，单位为 KB，小于等于 0 表示不限制
     */
    long long memory_limit = 0;

    /**
     * @brief 文件大小限制，单位为 KB，小于等于 0 表示不限制
     */
    long long file_limit = 0;

    /**
     * @brief 评测结果中保留的 stdout 字节数
     */
    std::size_t output_limit = 1 << 16;

    /**
     * @brief 从全局配置（config.hpp）读取资源限制
     */
    static execution_limits from_config();
};

/**
 * @brief 在隔离环境中执行候选解
 * 实现必须保证：无论候选解做什么（死循环、崩溃、调用 exit、修改全局状态），
 * execute 都会在时间限制加上一个有界的清理时间内返回一个评测结果，且不影响调用者进程。
 */
struct executor {
    virtual ~executor();

    /**
     * @brief 执行一次测试
     * @param artifact 由 test_case_builder 生成的工作目录
     * @param limits 资源限制
     * @return 评测结果，不会抛出与选手代码有关的异常
     */
    virtual execution_outcome execute(const test_artifact &artifact, const execution_limits &limits) = 0;
};

/**
 * @brief 子进程执行结束后收集到的原始信息
 */
struct child_report {
    /**
     * @brief 是否因超过时间限制被强制终止
     */
    bool timed_out = false;

    /**
     * @brief 子进程的退出码，被信号终止时无意义
     */
    int exit_code = 0;

    /**
     * @brief 终止子进程的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 结果管道中收到的完整行（不含 '\n'）
     */
    std::vector<std::string> lines;

    /**
     * @brief 结果管道末尾是否有不完整的行，通常是子进程写到一半时崩溃
     */
    bool incomplete_line = false;

    /**
     * @brief 结果管道读取出错的原因，比如单行消息过长
     */
    std::optional<std::string> channel_error;

    double elapsed_seconds = 0;
};

/**
 * @brief 根据子进程的原始信息得出评测结果
 * 判定顺序：
 * 1. 超时：TIMEOUT，保留已收到的测试点结果
 * 2. 结果管道出错、消息无法解析或顺序非法：TRANSPORT_ERROR
 * 3. 没有收到终止消息：CHILD_CRASHED
 * 4. fatal：HARNESS_INTERNAL_ERROR
 * 5. load_error：CANDIDATE_RAISED 或 MISSING_ENTRY_POINT
 * 6. done：子进程异常退出为 CHILD_CRASHED，测试点个数不符为 TRANSPORT_ERROR，否则汇总测试点结果
 */
execution_outcome classify(const child_report &report, std::size_t num_tests, double time_limit);

/**
 * @brief 通过 fork + exec harness-runner 执行候选解
 *
 * 子进程：
 * 1. 独立的进程组，超时时整个进程组都会被杀死
 * 2. stdin 为 /dev/null，stdout、stderr 写入工作目录下的文件
 * 3. 文件描述符 3 为结果管道
 * 4. 设置地址空间、CPU 时间、文件大小的 rlimit，禁止 core dump
 * 5. 工作目录为 test_artifact 的工作目录
 */
struct process_executor : executor {
    /**
     * @param runner_path harness-runner 可执行文件路径
     */
    explicit process_executor(std::filesystem::path runner_path);

    execution_outcome execute(const test_artifact &artifact, const execution_limits &limits) override;

private:
    std::filesystem::path runner_path;

    child_report run_child(const test_artifact &artifact, const execution_limits &limits);
};

}  // namespace harness

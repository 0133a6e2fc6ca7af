#pragma once

#include <cstddef>
#include <filesystem>

namespace harness {

/**
 * @brief harness-runner 的退出码
 * 只有 E_SUCCESS 表示子进程完整地执行了结果协议
 */
enum error_codes {
    E_SUCCESS = 0,
    E_INTERNAL_ERROR = 2
};

/**
 * @brief 每个候选解全部测试点的时间限制（时钟时间）
 * @note 单位为秒，默认 10 秒
 */
extern double TIME_LIMIT;

/**
 * @brief 子进程的地址空间限制
 * @note 单位为 KB，小于等于 0 表示不限制，默认 1GB
 */
extern long long MEMORY_LIMIT;

/**
 * @brief 子进程最多能写入的文件大小
 * @note 单位为 KB，小于等于 0 表示不限制，默认 64MB
 */
extern long long FILE_LIMIT;

/**
 * @brief 结果记录中最多保留多少字节的子进程标准输出
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 同时评测的 worker 数
 */
extern std::size_t CONCURRENCY;

/**
 * @brief harness-runner 可执行文件的路径
 * 默认为与 harness 可执行文件同目录下的 harness-runner
 */
extern std::filesystem::path RUNNER_PATH;

/**
 * @brief 候选解运行的根目录
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * ├── run-[uuid] // 一次执行的工作目录，执行结束后删除
 * │   ├── solution.py // 选手代码
 * │   ├── tests.json // 测试数据
 * │   ├── stdout.txt // 子进程的 stdout 输出
 * │   └── stderr.txt // 子进程的 stderr 输出（包括 runner 的日志）
 * └── run-...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，执行结束后不会删除工作目录，
 * 以便手动检查子进程的输出。
 */
extern bool DEBUG;

}  // namespace harness

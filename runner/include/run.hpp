#pragma once

#include "runner_options.hpp"

/**
 * @brief 加载选手代码并逐个执行测试点，通过结果管道报告结果
 * @note 该函数只在 harness 为每次执行创建的子进程中运行，选手代码与 runner 共享进程，
 * 崩溃、死循环等情况由父进程处理
 * 1. 读取测试数据，失败时发送 fatal
 * 2. 初始化 Python 解释器，将工作目录加入 sys.path
 * 3. 编译并执行选手代码（模块名为 solution），失败时发送 load_error(candidate_raised)
 * 4. 查找 solve 函数，不存在或不可调用时发送 load_error(missing_entry_point)
 * 5. 发送 loaded，对每个测试点：
 *    1. 将输入切分为行，调用 solve(lines)
 *    2. 对返回值调用 str()，与期望输出规范化后比较
 *    3. 发送 test，抛出异常时附带 traceback，输出不一致时附带期望输出与实际输出
 * 6. 发送 done
 * @return 完整执行了结果协议时返回 E_SUCCESS，否则返回 E_INTERNAL_ERROR
 */
int run_tests(const runner_options &opt);

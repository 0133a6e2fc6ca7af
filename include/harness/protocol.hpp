#pragma once

#include <optional>
#include <string>
#include "common/status.hpp"

/**
 * harness-runner 与父进程之间的结果协议
 *
 * runner 通过结果管道（默认为文件描述符 3）向父进程逐行写入 JSON 消息，
 * 每写完一行立即刷新，因此即使子进程超时被杀死，父进程也能拿到之前完成的测试点结果。
 *
 * 正常的消息顺序为：
 *   loaded → test(0) → test(1) → ... → test(n-1) → done
 * 加载失败时为：
 *   load_error
 * runner 无法执行协议时（参数错误、测试数据无法读取）为：
 *   fatal
 */
namespace harness::protocol {

enum class frame_type {
    LOADED,      // 选手代码加载成功，找到了 solve 函数
    LOAD_ERROR,  // 选手代码加载失败，kind 为 CANDIDATE_RAISED 或 MISSING_ENTRY_POINT
    TEST,        // 一个测试点的结果
    DONE,        // 所有测试点执行完毕
    FATAL        // runner 自身出错
};

struct frame {
    frame_type type = frame_type::FATAL;

    /**
     * @brief TEST 消息的测试点下标
     */
    std::size_t index = 0;

    /**
     * @brief TEST 消息表示测试点是否通过
     */
    bool passed = false;

    /**
     * @brief TEST、LOAD_ERROR 消息的失败原因
     */
    failure_kind kind = failure_kind::NONE;

    /**
     * @brief TEST 消息未通过时的详细信息
     */
    std::optional<std::string> detail;

    /**
     * @brief LOAD_ERROR、FATAL 消息的错误信息
     */
    std::string message;
};

frame make_loaded();

frame make_load_error(failure_kind kind, const std::string &message);

frame make_test(std::size_t index, bool passed, failure_kind kind, std::optional<std::string> detail);

frame make_done();

frame make_fatal(const std::string &message);

/**
 * @brief 将消息编码为一行 JSON，以 '\n' 结尾
 */
std::string encode_frame(const frame &f);

/**
 * @brief 解析一行消息（不含 '\n'）
 * @throw transport_error 若不是合法的消息
 */
frame decode_frame(const std::string &line);

}  // namespace harness::protocol

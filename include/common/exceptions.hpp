#pragma once

#include <stdexcept>
#include <string>

namespace harness {

/**
 * @brief 评测框架内所有异常的基类
 */
struct harness_exception : std::exception {
    harness_exception();
    explicit harness_exception(const std::string &message);

    const char *what() const noexcept override;

private:
    std::string message;
};

/**
 * @brief 表示评测框架自身的错误
 * 比如工作目录无法创建、子进程无法启动，与选手代码无关
 */
struct internal_error : public harness_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示子进程与父进程之间的结果通道出错
 * 比如子进程发回的消息无法解析、消息顺序不合法
 */
struct transport_error : public harness_exception {
    transport_error();
    explicit transport_error(const std::string &message);
};

}  // namespace harness

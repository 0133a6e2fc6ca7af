#pragma once

#include <boost/lexical_cast.hpp>
#include <chrono>
#include <string>

/**
 * @brief 根据 key 来查找环境变量，并转换为 T 类型
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @throw boost::bad_lexical_cast 若环境变量的值无法转换为 T
 */
template <typename T>
T get_env_as(const std::string &key, const T &def_value) {
    const char *result = getenv(key.c_str());
    if (!result) return def_value;
    return boost::lexical_cast<T>(result);
}

/**
 * @brief 计时器，构造时开始计时
 * 使用单调时钟，不受系统时间调整影响
 */
struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 已经过去的时间，单位为秒
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

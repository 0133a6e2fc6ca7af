#pragma once

#include <boost/python.hpp>
#include <string>

/**
 * @brief 初始化嵌入的 Python 解释器
 * 析构时只刷新 sys.stdout 和 sys.stderr，不调用 Py_FinalizeEx：
 * 选手代码可能留下仍在运行的非守护线程，Py_FinalizeEx 会一直等待它们结束。
 * boost::python 不支持 Py_Finalize，这里也不需要。
 */
class python_interpreter {
public:
    python_interpreter();
    ~python_interpreter();

    python_interpreter(const python_interpreter &) = delete;
    python_interpreter &operator=(const python_interpreter &) = delete;

    /**
     * @brief 刷新 sys.stdout 和 sys.stderr 的缓冲区
     */
    void flush_streams();
};

/**
 * @brief 将 Python 字符串转换为 UTF-8 编码的 std::string
 * 无法编码的字符（比如单独的代理对）会被替换
 */
std::string py_to_string(const boost::python::object &str);

/**
 * @brief 取出当前的 Python 异常，格式化为与解释器打印的一致的 traceback 文本
 * 在 catch (boost::python::error_already_set &) 中调用，调用后 Python 异常状态被清除。
 * 与 PyErr_Print 不同，SystemExit 不会导致进程退出。
 */
std::string fetch_python_exception();

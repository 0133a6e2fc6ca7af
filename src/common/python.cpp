#include "common/python.hpp"
#include <stdexcept>

namespace bp = boost::python;

python_interpreter::python_interpreter() {
    // 不注册信号处理函数，SIGINT 等信号保持默认行为
    Py_InitializeEx(0);
    if (!Py_IsInitialized())
        throw std::runtime_error("unable to initialize python interpreter");
}

python_interpreter::~python_interpreter() {
    flush_streams();
}

void python_interpreter::flush_streams() {
    for (const char *name : {"stdout", "stderr"}) {
        try {
            bp::object stream = bp::import("sys").attr(name);
            if (!stream.is_none()) stream.attr("flush")();
        } catch (bp::error_already_set &) {
            // 选手代码可能关闭或替换了标准输出
            PyErr_Clear();
        }
    }
}

std::string py_to_string(const bp::object &str) {
    bp::object bytes = str.attr("encode")("utf-8", "replace");
    char *data;
    Py_ssize_t size;
    if (PyBytes_AsStringAndSize(bytes.ptr(), &data, &size) != 0)
        bp::throw_error_already_set();
    return std::string(data, size);
}

/**
 * @brief 接管 obj 的引用，nullptr 对应 None
 */
static bp::object steal_object(PyObject *obj) {
    return obj ? bp::object(bp::handle<>(obj)) : bp::object();
}

std::string fetch_python_exception() {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type) return "";
    PyErr_NormalizeException(&type, &value, &traceback);
    if (value && traceback) PyException_SetTraceback(value, traceback);

    bp::object type_obj = steal_object(type);
    bp::object value_obj = steal_object(value);
    bp::object traceback_obj = steal_object(traceback);

    try {
        bp::object lines = bp::import("traceback").attr("format_exception")(type_obj, value_obj, traceback_obj);
        return py_to_string(bp::str("").join(lines));
    } catch (bp::error_already_set &) {
        // traceback 模块不可用（比如选手代码修改了 sys.modules），退化为 str
        PyErr_Clear();
    }

    try {
        return py_to_string(bp::str(value_obj.is_none() ? type_obj : value_obj));
    } catch (bp::error_already_set &) {
        PyErr_Clear();
        return "unknown exception";
    }
}

#pragma once

#include <Python.h>

namespace coderun {

class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

private:
    PyGILState_STATE state;
};

/**
 * @brief 在作用域内释放当前线程持有的 GIL，用于长时间的阻塞等待
 */
class PyThread_guard {
public:
    PyThread_guard();
    ~PyThread_guard();

private:
    PyThreadState *state;
};

/**
 * @brief 进程内嵌入的 Python 解释器
 * 构造时初始化解释器并释放 GIL，之后任何线程都需要通过 GIL_guard 来使用解释器。
 * 由于 Boost.Python 不支持 Py_Finalize，析构时只会重新获取 GIL，不会销毁解释器。
 * 整个进程只应该存在一个该对象。
 */
class embedded_interpreter {
public:
    embedded_interpreter();
    ~embedded_interpreter();

    embedded_interpreter(const embedded_interpreter &) = delete;
    embedded_interpreter &operator=(const embedded_interpreter &) = delete;

private:
    PyThreadState *state = nullptr;
};

}  // namespace coderun

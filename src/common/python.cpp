#include "common/python.hpp"

namespace coderun {

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

PyThread_guard::PyThread_guard() {
    state = PyEval_SaveThread();
}

PyThread_guard::~PyThread_guard() {
    PyEval_RestoreThread(state);
}

embedded_interpreter::embedded_interpreter() {
    if (Py_IsInitialized()) return;
    // 不安装信号处理函数，SIGINT 仍然由宿主程序处理
    Py_InitializeEx(0);
    state = PyEval_SaveThread();
}

embedded_interpreter::~embedded_interpreter() {
    if (state) PyEval_RestoreThread(state);
}

}  // namespace coderun

#include "execution/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/python.hpp>
#include <boost/python/raw_function.hpp>
#include <boost/python/stl_iterator.hpp>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <system_error>
#include <vector>
#include "common/exceptions.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;
namespace bp = boost::python;

// 这些 builtins 允许脚本绕过沙箱（读写文件、动态执行代码、退出宿主进程、按名字访问属性）
static const char *const BLOCKED_BUILTINS[] = {
    "open", "exec", "eval", "compile", "exit", "quit", "breakpoint", "help", "input", "__import__",
    "getattr", "setattr", "delattr", "vars", "globals", "locals"};

// 通过帧对象可以拿到其他模块的全局作用域
static const char *const BLOCKED_ATTRIBUTES[] = {
    "gi_frame", "gi_code", "cr_frame", "ag_frame", "tb_frame", "f_back", "f_globals", "f_locals", "f_builtins"};

/**
 * @brief 一次脚本执行的 I/O 状态
 * 由注入到脚本全局作用域的函数共享
 */
struct sandbox_io {
    std::vector<std::string> lines;
    size_t next_line = 0;
    std::string out;
    std::vector<std::string> err;

    std::string read_line() {
        return next_line < lines.size() ? lines[next_line++] : "";
    }
};

/**
 * @brief 管道文件描述符，析构时关闭
 */
struct pipe_end {
    int fd = -1;

    ~pipe_end() {
        reset();
    }

    void reset() {
        if (fd >= 0) close(fd);
        fd = -1;
    }
};

static string to_text(const bp::object &obj) {
    string text = bp::extract<string>(bp::str(obj));
    return text;
}

static string join_args(const bp::tuple &args, const string &sep) {
    vector<string> pieces;
    for (bp::ssize_t i = 0; i < bp::len(args); ++i)
        pieces.push_back(to_text(args[i]));
    return boost::algorithm::join(pieces, sep);
}

static string keyword_or(const bp::dict &kwargs, const char *key, const string &def_value) {
    if (!kwargs.has_key(key) || bp::object(kwargs[key]).is_none()) return def_value;
    return to_text(kwargs[key]);
}

/**
 * @brief 取出当前的 Python 异常并格式化为 "<异常类型>: <信息>"
 */
static string fetch_python_error() {
    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    bp::handle<> htype(bp::allow_null(type)), hvalue(bp::allow_null(value)), htraceback(bp::allow_null(traceback));
    if (!htype) return "Unknown error";

    string name = "Exception";
    try {
        name = bp::extract<string>(bp::object(htype).attr("__name__"))();
        if (!hvalue) return name;
        string message = to_text(bp::object(hvalue));
        return message.empty() ? name : name + ": " + message;
    } catch (bp::error_already_set &) {
        // 异常对象的 __str__ 本身出错
        PyErr_Clear();
        return name;
    }
}

static bool is_blocked_attribute(const string &attr) {
    if (attr.size() > 4 && boost::algorithm::starts_with(attr, "__") && boost::algorithm::ends_with(attr, "__"))
        return true;
    for (const char *name : BLOCKED_ATTRIBUTES)
        if (attr == name) return true;
    return false;
}

/**
 * @brief 执行前检查语法树，拒绝访问双下划线属性和帧对象的属性
 * 否则脚本可以从 ().__class__ 出发遍历对象图，不经过 import 拿到 os 等模块
 */
static void reject_blocked_attributes(const string &code) {
    bp::object ast = bp::import("ast");
    bp::object tree = ast.attr("parse")(code, "user_code");
    bp::object attribute_type = ast.attr("Attribute");
    bp::object nodes = ast.attr("walk")(tree);

    for (bp::stl_input_iterator<bp::object> it(nodes), end; it != end; ++it) {
        bp::object node = *it;
        if (PyObject_IsInstance(node.ptr(), attribute_type.ptr()) != 1) continue;
        string attr = bp::extract<string>(node.attr("attr"))();
        if (is_blocked_attribute(attr)) {
            PyErr_SetString(PyExc_PermissionError, fmt::format("Access to attribute '{}' is not allowed", attr).c_str());
            bp::throw_error_already_set();
        }
    }
}

/**
 * @brief 构造脚本的全局作用域，所有能力都显式注入
 */
static bp::dict make_globals(const shared_ptr<sandbox_io> &io) {
    bp::dict builtins(bp::import("builtins").attr("__dict__"));
    for (const char *name : BLOCKED_BUILTINS)
        builtins.attr("pop")(name, bp::object());

    auto deny_import = [](bp::tuple, bp::dict) -> bp::object {
        PyErr_SetString(PyExc_ImportError, "Module not allowed");
        bp::throw_error_already_set();
        return bp::object();
    };
    auto print = [io](bp::tuple args, bp::dict kwargs) -> bp::object {
        io->out += join_args(args, keyword_or(kwargs, "sep", " ")) + keyword_or(kwargs, "end", "\n");
        return bp::object();
    };
    auto log = [io](bp::tuple args, bp::dict) -> bp::object {
        io->out += join_args(args, " ") + "\n";
        return bp::object();
    };
    auto error = [io](bp::tuple args, bp::dict) -> bp::object {
        io->err.push_back(join_args(args, " "));
        return bp::object();
    };
    auto read = [io](bp::tuple, bp::dict) -> bp::object {
        return bp::object(io->read_line());
    };

    bp::object read_fn = bp::raw_function(read);
    builtins["__import__"] = bp::raw_function(deny_import);
    builtins["print"] = bp::raw_function(print);
    builtins["input"] = read_fn;

    bp::object console = bp::import("types").attr("SimpleNamespace")();
    console.attr("log") = bp::raw_function(log);
    console.attr("warn") = bp::raw_function(log);
    console.attr("error") = bp::raw_function(error);

    bp::dict globals;
    globals["__builtins__"] = builtins;
    globals["__name__"] = "__main__";
    globals["console"] = console;
    globals["readLine"] = read_fn;
    globals["gets"] = read_fn;
    globals["prompt"] = read_fn;
    return globals;
}

static void run_script(const string &code, const shared_ptr<sandbox_io> &io) {
    reject_blocked_attributes(code);
    bp::dict globals = make_globals(io);

    bp::handle<> code_object(bp::allow_null(Py_CompileString(code.c_str(), "user_code", Py_file_input)));
    if (!code_object) bp::throw_error_already_set();

    bp::handle<> ret(bp::allow_null(PyEval_EvalCode(code_object.get(), globals.ptr(), globals.ptr())));
    if (!ret) bp::throw_error_already_set();
}

static void write_all(int fd, const string &data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "unable to write script result");
        }
        written += n;
    }
}

/**
 * @brief 子进程：执行脚本并将 stdout 和错误信息以 JSON 写入管道，不会返回
 */
[[noreturn]] static void run_child(const string &code, const shared_ptr<sandbox_io> &io, int timeout_ms, int fd) {
    // 避免子进程被终止，要求父进程处理中断信号
    signal(SIGINT, SIG_IGN);

    // 父进程异常退出时，CPU 时间限制保证子进程最终会被终止
    rlim_t cpu_seconds = timeout_ms / 1000 + 2;
    struct rlimit lim = {cpu_seconds, cpu_seconds + 1};
    try {
        if (setrlimit(RLIMIT_CPU, &lim) != 0)
            throw system_error(errno, generic_category(), "setrlimit");
        run_script(code, io);
    } catch (bp::error_already_set &) {
        io->err.push_back(fetch_python_error());
    } catch (std::exception &e) {
        io->err.push_back(e.what());
    }

    try {
        json outcome = {{"stdout", io->out}, {"stderr", io->err}};
        write_all(fd, outcome.dump(-1, ' ', false, json::error_handler_t::replace));
    } catch (std::exception &) {
        _exit(EXIT_FAILURE);
    }
    _exit(EXIT_SUCCESS);
}

struct child_outcome {
    string payload;
    bool timed_out = false;
    int status = 0;
};

/**
 * @brief 父进程：读取子进程的输出，超过 timeout_ms 时发送 SIGKILL
 */
static child_outcome wait_child(pid_t pid, int fd, int timeout_ms) {
    child_outcome outcome;
    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(timeout_ms);
    char buf[4096];

    while (true) {
        auto remaining = chrono::duration_cast<chrono::microseconds>(deadline - chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            outcome.timed_out = true;
            break;
        }

        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(fd, &readfds);
        struct timeval tv = {(time_t)(remaining / 1000000), (suseconds_t)(remaining % 1000000)};
        int r = select(fd + 1, &readfds, nullptr, nullptr, &tv);
        if (r < 0 && errno == EINTR) continue;
        if (r < 0) {
            outcome.timed_out = true;  // 无法继续等待，按超时处理并终止子进程
            LOG(ERROR) << "select on script pipe failed: " << strerror(errno);
            break;
        }
        if (r == 0) continue;

        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        outcome.payload.append(buf, n);
    }

    if (outcome.timed_out && kill(pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send SIGKILL to script process " << pid << ": " << strerror(errno);

    while (waitpid(pid, &outcome.status, 0) < 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), "unable to wait for script process");
    }
    return outcome;
}

/**
 * @brief 在子进程中执行脚本，宿主进程的状态不受脚本影响
 * @throw std::system_error 无法创建管道或者子进程
 */
static void run_isolated(const string &code, const shared_ptr<sandbox_io> &io, int timeout_ms) {
    int fds[2];
    if (pipe(fds) != 0)
        throw system_error(errno, system_category(), "unable to create pipe");
    pipe_end read_end{fds[0]}, write_end{fds[1]};

    PyOS_BeforeFork();
    pid_t pid = fork();
    if (pid == 0) {
        PyOS_AfterFork_Child();
        read_end.reset();
        run_child(code, io, timeout_ms, write_end.fd);
    }
    PyOS_AfterFork_Parent();
    if (pid < 0)
        throw system_error(errno, system_category(), "unable to fork");
    write_end.reset();

    child_outcome outcome;
    {
        PyThread_guard unlocked;
        outcome = wait_child(pid, read_end.fd, timeout_ms);
    }

    if (outcome.timed_out) {
        io->err.push_back(fmt::format("TimeoutError: Script execution timeout: exceeded {}ms", timeout_ms));
        return;
    }

    json data = json::parse(outcome.payload, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        if (WIFSIGNALED(outcome.status))
            io->err.push_back(fmt::format("Script process terminated by signal {}", WTERMSIG(outcome.status)));
        else
            io->err.push_back("Script process exited unexpectedly");
        return;
    }
    io->out = data.value("stdout", "");
    for (auto &message : data.value("stderr", json::array()))
        io->err.push_back(message.get<string>());
}

execution_result run_local(const string &code, const string &stdin_data, int timeout_ms) {
    elapsed_time timer;
    auto io = make_shared<sandbox_io>();
    io->lines = split_lines(stdin_data);

    if (!Py_IsInitialized()) {
        io->err.push_back("Script interpreter is not available");
    } else {
        GIL_guard guard;
        try {
            run_isolated(code, io, timeout_ms);
        } catch (std::exception &e) {
            io->err.push_back(e.what());
        }
    }

    execution_result result;
    result.backend = "sandbox";
    result.runtime = fmt::format("{}ms", timer.duration<chrono::milliseconds>().count());
    result.memory = MEMORY_UNAVAILABLE;
    if (io->err.empty()) {
        result.stdout_data = io->out;
        result.exit_code = 0;
    } else {
        // 出错时 stdout 可能只输出了一部分，不返回给调用方
        result.stderr_data = boost::algorithm::join(io->err, "\n");
        result.exit_code = 1;
        DLOG(INFO) << "Sandbox script failed: " << *result.stderr_data;
    }
    return result;
}

string sandbox_executor::name() const {
    return "sandbox";
}

execution_result sandbox_executor::execute(const execution_request &request) const {
    if (request.lang != language::script)
        throw unsupported_language_error(fmt::format("sandbox only runs script code, got {}", to_string(request.lang)));
    return run_local(request.code, request.stdin_data, request.timeout_ms);
}

}  // namespace coderun

#pragma once

#include <string>
#include "execution/request.hpp"

namespace coderun {

/**
 * @brief 在进程内嵌入的解释器中直接执行 script 代码，不进行任何网络调用
 *
 * 代码只能访问受限的 builtins：
 * 1. print 以及 console.log/console.warn 写入 stdout，console.error 写入 stderr；
 * 2. readLine、gets、prompt、input 依次读取预先切分好的输入行，读完后返回空串；
 * 3. import 任何模块都会立即失败（Module not allowed）；
 * 4. 访问双下划线属性或者帧对象的属性会在执行前被拒绝（PermissionError）。
 *
 * 脚本在 fork 出的子进程中执行，超过 timeout_ms 后父进程直接 SIGKILL 子进程，
 * 即使脚本正阻塞在一个耗时的内建函数调用里。超时或者任何未捕获的异常都会写入 stderr，
 * 此时 stdout 被认为不可靠而丢弃。该函数不会抛出异常。
 *
 * @note 调用前进程内必须已经存在 embedded_interpreter
 * @param code 脚本代码
 * @param stdin_data 标准输入
 * @param timeout_ms 墙上时间限制（毫秒）
 */
execution_result run_local(const std::string &code, const std::string &stdin_data, int timeout_ms);

/**
 * @brief 本地沙箱执行器，只负责 script 语言
 */
struct sandbox_executor {
    std::string name() const;

    /**
     * @throw unsupported_language_error 请求的语言不是 script
     */
    execution_result execute(const execution_request &request) const;
};

}  // namespace coderun

#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace coderun {

struct coderun_exception : std::exception {
    coderun_exception();
    explicit coderun_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const coderun_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示编排系统的内部错误
 * 一般是配置错误，比如执行链为空
 */
struct internal_error : public coderun_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示提交请求本身不合法
 * 比如语言不受支持、测试数据缺少字段，此时不会调用任何执行后端
 */
struct validation_error : public coderun_exception {
    validation_error();
    explicit validation_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public coderun_exception {
    network_error();
    explicit network_error(const std::string &message, bool unreachable = false);

    /**
     * @brief 是否是无法连接到远程主机（连接被拒绝或者域名无法解析）
     */
    bool unreachable = false;
};

/**
 * @brief 远程执行后端失败的原因，仅用于日志诊断
 * 执行链对所有原因一视同仁，都会继续尝试下一个执行器
 */
enum class failure_cause {
    unsupported_language,
    request_format,
    rate_limited,
    server_error,
    unreachable,
    http_error,
    malformed_response
};

const char *get_display_message(failure_cause cause);

/**
 * @brief 表示远程执行后端调用失败
 */
struct backend_error : public coderun_exception {
    backend_error(const std::string &backend, failure_cause cause, const std::string &message, int http_status = 0, const std::string &body = "");

    /**
     * @brief 出错的后端名称，比如 service、compiler-api
     */
    std::string backend;

    failure_cause cause;

    /**
     * @brief HTTP 状态码，若没有收到响应则为 0
     */
    int http_status;

    /**
     * @brief 响应体，用于排查问题
     */
    std::string body;
};

/**
 * @brief 执行器不负责该语言
 * 比如本地沙箱只运行 script 代码，执行链收到该异常后会尝试下一个执行器
 */
struct unsupported_language_error : public coderun_exception {
    unsupported_language_error();
    explicit unsupported_language_error(const std::string &message);
};

/**
 * @brief 表示用户代码本身执行失败
 * 比如模拟执行判定代码结构不完整，或者模拟出的运行时错误
 */
struct execution_error : public coderun_exception {
    execution_error();
    explicit execution_error(const std::string &message);
};

}  // namespace coderun

#pragma once

#include <functional>
#include <map>
#include <string>

namespace coderun {

struct http_request {
    std::string url;

    std::map<std::string, std::string> headers;

    /**
     * @brief POST 请求体，本系统只发送 JSON
     */
    std::string body;

    /**
     * @brief 整个请求（包括连接）的超时时间（毫秒）
     */
    long timeout_ms;
};

struct http_response {
    long status = 0;

    std::string body;

    bool ok() const;
};

/**
 * @brief 发送 HTTP POST 请求的函数
 * 收到任何响应（包括非 2xx）都返回 http_response，
 * 只有网络层面的失败（连接失败、超时）才抛出 network_error。
 * 测试时可以替换为假的实现。
 */
typedef std::function<http_response(const http_request &)> http_transport;

/**
 * @brief 基于 libcurl 的 HTTP 传输实现
 * @throw network_error 连接失败、超时等 CURL 错误
 */
http_response curl_post(const http_request &request);

}  // namespace coderun

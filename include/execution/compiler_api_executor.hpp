#pragma once

#include <optional>
#include <string>
#include "config.hpp"
#include "execution/http.hpp"
#include "execution/request.hpp"

namespace coderun {

/**
 * @brief 第三方编译 API 中的语言标识
 */
struct provider_language {
    std::string id;

    int version_index;
};

/**
 * @brief 查找内部语言在第三方编译 API 中对应的语言标识
 * @return 不支持的语言返回 nullopt
 */
std::optional<provider_language> find_provider_language(language lang);

/**
 * @brief 第三方编译 API 的适配器
 *
 * 请求：POST <url>
 * @code{.json}
 * {"language": "cpp17", "versionIndex": 0, "code": "...", "input": "1 2", "save": false, "timeout": 8}
 * @endcode
 * 其中 timeout 以秒为单位，且不超过 max_timeout_seconds。
 *
 * 响应：{"output"|"stdout": "...", "errors"|"stderr": "...", "executionTime"|"runtime": ..., "memory": ...}
 *
 * HTTP 错误会按状态码区分原因（格式错误、限流、服务器错误、无法连接），仅用于日志诊断。
 */
struct compiler_api_executor {
    compiler_api_executor(const compiler_api_config &config, http_transport transport);

    std::string name() const;

    /**
     * @throw backend_error 语言不受支持、HTTP 错误，或者响应为空、格式错误、缺少输出字段
     */
    execution_result execute(const execution_request &request) const;

private:
    compiler_api_config config;
    http_transport transport;
};

}  // namespace coderun

#pragma once

#include <string>
#include "config.hpp"
#include "execution/http.hpp"
#include "execution/request.hpp"

namespace coderun {

/**
 * @brief 自建执行服务的适配器
 *
 * 请求：POST <base_url>/api/execute
 * @code{.json}
 * {"language": "cpp", "files": [{"content": "..."}], "timeout": 8000, "stdin": "1 2"}
 * @endcode
 *
 * 响应可以是嵌套格式 {"run": {"output": "...", "stderr": "..."}}，
 * 也可以是扁平格式 {"stdout": "...", "stderr": "..."}，
 * 另外可以带有 runtimeMs、memoryKb、exitCode。
 */
struct service_executor {
    service_executor(const service_config &config, http_transport transport);

    std::string name() const;

    /**
     * @throw backend_error 非 2xx 响应，或者响应为空、格式错误、缺少输出字段
     * @throw network_error 无法连接或者请求超时
     */
    execution_result execute(const execution_request &request) const;

private:
    std::string endpoint;
    http_transport transport;
};

}  // namespace coderun

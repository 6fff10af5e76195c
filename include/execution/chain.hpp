#pragma once

#include <string>
#include <variant>
#include <vector>
#include "config.hpp"
#include "execution/compiler_api_executor.hpp"
#include "execution/http.hpp"
#include "execution/request.hpp"
#include "execution/sandbox.hpp"
#include "execution/service_executor.hpp"
#include "execution/simulation.hpp"

namespace coderun {

/**
 * @brief 所有执行器，每个执行器都提供 name() 和 execute(request)
 */
typedef std::variant<sandbox_executor, service_executor, compiler_api_executor, simulation_executor> executor;

std::string executor_name(const executor &exec);

/**
 * @brief 按优先级依次尝试的执行器列表
 *
 * 除了最后一个执行器，任何一个执行器抛出异常都只会记录日志并尝试下一个；
 * 最后一个执行器的结果或者异常原样返回给调用者。
 * 执行链不记录执行器的健康状态，每次调用都从头开始尝试。
 */
struct execution_chain {
    std::vector<executor> executors;

    /**
     * @throw internal_error 执行链为空
     * @throw std::exception 最后一个执行器抛出的异常
     */
    execution_result execute_best_effort(const execution_request &request) const;
};

/**
 * @brief 构造默认的执行链：本地沙箱（可配置关闭）、自建执行服务、第三方编译 API、模拟执行
 */
execution_chain make_default_chain(const configuration &config, http_transport transport, random_source rng);

/**
 * @brief 运行一次代码，不做答案比较
 * 与评测不同，这里允许 script 语言。执行链最终失败时不会抛出异常，
 * 而是返回 stderr 为错误信息的结果。
 *
 * @throw validation_error 语言不受支持
 */
execution_result run_once(const execution_chain &chain, const std::string &code, const std::string &lang,
                          const std::string &stdin_data, int timeout_ms);

/**
 * @brief 单次运行的状态文本
 * 没有错误为 Completed，错误信息包含 compile 为 Compilation Error，
 * 包含 time 为 Time Limit Exceeded，其他为 Runtime Error
 */
std::string classify_run_status(const execution_result &result);

}  // namespace coderun

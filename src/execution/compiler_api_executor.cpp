#include "execution/compiler_api_executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <algorithm>
#include <nlohmann/json.hpp>
#include <unordered_map>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<language, provider_language> provider_languages = boost::assign::map_list_of
    (language::java, provider_language{"java", 0})
    (language::cpp, provider_language{"cpp17", 0})
    (language::python, provider_language{"python3", 0});
// clang-format on

optional<provider_language> find_provider_language(language lang) {
    auto it = provider_languages.find(lang);
    if (it == provider_languages.end()) return nullopt;
    return it->second;
}

compiler_api_executor::compiler_api_executor(const compiler_api_config &config, http_transport transport)
    : config(config), transport(move(transport)) {}

string compiler_api_executor::name() const {
    return "compiler-api";
}

/**
 * @brief 将 HTTP 错误响应归类
 */
static backend_error classify_http_error(const string &backend, const http_response &response) {
    if (response.status == 422) {
        json data = json::parse(response.body, nullptr, false);
        string message = "Invalid request format";
        if (!data.is_discarded())
            message = get_value_def<string>(data, message, "message");
        return backend_error(backend, failure_cause::request_format, "Compiler API format error: " + message, response.status, response.body);
    } else if (response.status == 429) {
        return backend_error(backend, failure_cause::rate_limited, "Compiler API rate limit exceeded", response.status, response.body);
    } else if (response.status >= 500) {
        return backend_error(backend, failure_cause::server_error, "Compiler API server error", response.status, response.body);
    } else {
        return backend_error(backend, failure_cause::http_error, fmt::format("Compiler API HTTP {}", response.status), response.status, response.body);
    }
}

/**
 * @brief 运行时间和内存字段可能是数字也可能是已经格式化的文本
 */
static optional<string> get_measurement(const json &data, const char *key, const char *unit) {
    const json *ref = find_path(data, key);
    if (!ref) return nullopt;
    if (ref->is_string() && !ref->get<string>().empty()) return ref->get<string>();
    if (ref->is_number_integer()) return fmt::format("{}{}", ref->get<long long>(), unit);
    if (ref->is_number()) return fmt::format("{:.1f}{}", ref->get<double>(), unit);
    return nullopt;
}

execution_result compiler_api_executor::execute(const execution_request &request) const {
    auto provider = find_provider_language(request.lang);
    if (!provider)
        throw backend_error(name(), failure_cause::unsupported_language,
                            fmt::format("Compiler API does not support {}", to_string(request.lang)));

    double timeout_seconds = min(request.timeout_ms / 1000.0, config.max_timeout_seconds);
    json payload = {{"language", provider->id},
                    {"versionIndex", provider->version_index},
                    {"code", request.code},
                    {"input", request.stdin_data},
                    {"save", false},
                    {"timeout", timeout_seconds}};

    LOG(INFO) << "Sending " << provider->id << " code to compiler API (code length " << request.code.size()
              << ", input length " << request.stdin_data.size() << ", timeout " << timeout_seconds << "s)";

    elapsed_time timer;
    http_response response;
    try {
        response = transport({config.url,
                              {{"Content-Type", "application/json"},
                               {"Accept", "application/json"},
                               {"User-Agent", config.user_agent}},
                              payload.dump(),
                              request.timeout_ms + config.request_buffer_ms});
    } catch (network_error &e) {
        failure_cause cause = e.unreachable ? failure_cause::unreachable : failure_cause::http_error;
        LOG(ERROR) << "Compiler API request failed (" << get_display_message(cause) << "): " << e.what();
        throw backend_error(name(), cause,
                            e.unreachable ? "Unable to connect to compiler API" : string(e.what()));
    }

    if (!response.ok()) {
        backend_error error = classify_http_error(name(), response);
        LOG(ERROR) << "Compiler API execution failed (" << get_display_message(error.cause) << "), HTTP "
                   << response.status << ": " << response.body;
        throw error;
    }

    json data = json::parse(response.body, nullptr, false);
    if (data.is_discarded() || !data.is_object() || data.empty())
        throw backend_error(name(), failure_cause::malformed_response, "Empty response from compiler API", response.status, response.body);

    auto output = get_string(data, "output");
    if (!output) output = get_string(data, "stdout");
    if (!output)
        throw backend_error(name(), failure_cause::malformed_response, "Response from compiler API has no output", response.status, response.body);

    auto error = get_string(data, "errors");
    if (!error || error->empty()) error = get_string(data, "stderr");

    execution_result result;
    result.backend = name();
    result.stdout_data = *output;
    if (error && !error->empty())
        result.stderr_data = *error;

    auto runtime = get_measurement(data, "executionTime", "ms");
    if (!runtime) runtime = get_measurement(data, "runtime", "ms");
    if (!runtime) {
        result.runtime = fmt::format("{}ms", timer.duration<chrono::milliseconds>().count());
    } else if (auto runtime_ms = parse_runtime_ms(*runtime)) {
        // 统一为 "<n>ms"，例如 "0.5s" 转换为 "500ms"
        result.runtime = fmt::format("{}ms", *runtime_ms);
    } else {
        result.runtime = *runtime;
    }
    result.memory = get_measurement(data, "memory", "KB").value_or(MEMORY_UNAVAILABLE);

    auto exit_code = get_int(data, "exitCode");
    if (exit_code && *exit_code != 0)
        result.exit_code = *exit_code;
    else
        result.exit_code = result.stdout_data.empty() ? 1 : 0;

    LOG(INFO) << "Compiler API finished " << provider->id << " (runtime " << result.runtime
              << ", exit code " << *result.exit_code << ")";
    return result;
}

}  // namespace coderun

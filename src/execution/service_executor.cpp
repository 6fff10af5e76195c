#include "execution/service_executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

service_executor::service_executor(const service_config &config, http_transport transport)
    : endpoint(config.base_url + "/api/execute"), transport(move(transport)) {}

string service_executor::name() const {
    return "service";
}

execution_result service_executor::execute(const execution_request &request) const {
    json body = {{"language", to_string(request.lang)},
                 {"files", json::array({{{"content", request.code}}})},
                 {"timeout", request.timeout_ms},
                 {"stdin", request.stdin_data}};

    LOG(INFO) << "Attempting " << to_string(request.lang) << " execution via " << endpoint;

    elapsed_time timer;
    http_response response = transport({endpoint,
                                        {{"Content-Type", "application/json"}},
                                        body.dump(),
                                        (long)request.timeout_ms});

    if (!response.ok()) {
        LOG(ERROR) << "Execution service HTTP " << response.status << ": " << response.body;
        throw backend_error(name(),
                            response.status >= 500 ? failure_cause::server_error : failure_cause::http_error,
                            fmt::format("Local executor HTTP {}: {}", response.status, response.body),
                            response.status, response.body);
    }

    json data = json::parse(response.body, nullptr, false);
    if (data.is_discarded() || !data.is_object())
        throw backend_error(name(), failure_cause::malformed_response, "Invalid response from local executor", response.status, response.body);

    auto output = get_string(data, "run", "output");
    if (!output) output = get_string(data, "stdout");
    if (!output)
        throw backend_error(name(), failure_cause::malformed_response, "Response from local executor has no output", response.status, response.body);

    auto error = get_string(data, "run", "stderr");
    if (!error) error = get_string(data, "stderr");

    execution_result result;
    result.backend = name();
    result.stdout_data = *output;
    if (error && !error->empty())
        result.stderr_data = *error;

    if (auto runtime_ms = get_integer(data, "runtimeMs"); runtime_ms && *runtime_ms > 0)
        result.runtime = fmt::format("{}ms", *runtime_ms);
    else
        result.runtime = fmt::format("{}ms", timer.duration<chrono::milliseconds>().count());

    if (auto memory_kb = get_integer(data, "memoryKb"); memory_kb && *memory_kb > 0)
        result.memory = fmt::format("{}KB", *memory_kb);
    else
        result.memory = MEMORY_UNAVAILABLE;

    auto exit_code = get_int(data, "exitCode");
    if (exit_code && *exit_code != 0)
        result.exit_code = *exit_code;
    else
        result.exit_code = result.stdout_data.empty() ? 1 : 0;

    LOG(INFO) << "Execution service finished " << to_string(request.lang)
              << " (runtime " << result.runtime << ", exit code " << *result.exit_code << ")";
    return result;
}

}  // namespace coderun

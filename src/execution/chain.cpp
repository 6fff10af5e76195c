#include "execution/chain.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"

namespace coderun {
using namespace std;

string executor_name(const executor &exec) {
    return visit([](auto &&e) { return e.name(); }, exec);
}

execution_result execution_chain::execute_best_effort(const execution_request &request) const {
    if (executors.empty())
        throw internal_error("Execution chain has no executors");

    for (size_t i = 0; i + 1 < executors.size(); ++i) {
        const executor &exec = executors[i];
        try {
            LOG(INFO) << "Trying executor " << executor_name(exec) << " for " << to_string(request.lang);
            return visit([&](auto &&e) { return e.execute(request); }, exec);
        } catch (unsupported_language_error &ex) {
            DLOG(INFO) << "Executor " << executor_name(exec) << " skipped: " << ex.what();
        } catch (backend_error &ex) {
            LOG(WARNING) << "Executor " << executor_name(exec) << " failed (" << get_display_message(ex.cause)
                         << "), falling through: " << ex.what();
        } catch (std::exception &ex) {
            LOG(WARNING) << "Executor " << executor_name(exec) << " failed, falling through: " << ex.what();
        }
    }

    const executor &last = executors.back();
    LOG(INFO) << "Trying last executor " << executor_name(last) << " for " << to_string(request.lang);
    return visit([&](auto &&e) { return e.execute(request); }, last);
}

execution_chain make_default_chain(const configuration &config, http_transport transport, random_source rng) {
    execution_chain chain;
    if (config.sandbox_enabled)
        chain.executors.emplace_back(sandbox_executor{});
    chain.executors.emplace_back(service_executor(config.service, transport));
    chain.executors.emplace_back(compiler_api_executor(config.compiler_api, transport));
    chain.executors.emplace_back(simulation_executor(move(rng)));
    return chain;
}

execution_result run_once(const execution_chain &chain, const string &code, const string &lang,
                          const string &stdin_data, int timeout_ms) {
    auto parsed = parse_language(lang);
    if (!parsed)
        throw validation_error(fmt::format("Unsupported language: {}", lang));

    execution_request request{code, *parsed, stdin_data, timeout_ms};
    try {
        return chain.execute_best_effort(request);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Execution of " << to_string(*parsed) << " code failed: " << ex.what();
        execution_result result;
        result.backend = "none";
        result.stderr_data = ex.what();
        result.exit_code = 1;
        result.runtime = "0ms";
        result.memory = MEMORY_UNAVAILABLE;
        return result;
    }
}

string classify_run_status(const execution_result &result) {
    if (!result.stderr_data || boost::algorithm::trim_copy(*result.stderr_data).empty())
        return "Completed";
    string error = boost::algorithm::to_lower_copy(*result.stderr_data);
    if (error.find("compile") != string::npos) return "Compilation Error";
    if (error.find("time") != string::npos) return "Time Limit Exceeded";
    return "Runtime Error";
}

}  // namespace coderun

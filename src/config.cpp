#include "config.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, service_config &config) {
    if (j.count("baseUrl"))
        j.at("baseUrl").get_to(config.base_url);
}

void from_json(const json &j, compiler_api_config &config) {
    if (j.count("url")) j.at("url").get_to(config.url);
    if (j.count("maxTimeoutSeconds")) j.at("maxTimeoutSeconds").get_to(config.max_timeout_seconds);
    if (j.count("requestBufferMs")) j.at("requestBufferMs").get_to(config.request_buffer_ms);
    if (j.count("userAgent")) j.at("userAgent").get_to(config.user_agent);
}

void from_json(const json &j, configuration &config) {
    if (j.count("service"))
        j.at("service").get_to(config.service);
    if (j.count("compilerApi"))
        j.at("compilerApi").get_to(config.compiler_api);
    config.sandbox_enabled = get_value_def(j, true, "sandbox", "enabled");
    config.time_limit_ms = get_value_def(j, 8000, "grading", "timeLimitMs");
    if (exists(j, "simulation", "seed"))
        config.simulation_seed = j.at("simulation").at("seed").get<unsigned long long>();
}

string normalize_base_url(const string &url) {
    string result = url;
    while (!result.empty() && result.back() == '/')
        result.pop_back();
    if (boost::algorithm::ends_with(result, "/api"))
        result.erase(result.size() - 4);
    else if (result == "api")
        result.clear();
    return result;
}

void resolve_configuration(configuration &config) {
    if (config.service.base_url.empty()) {
        auto env = first_env({"SELF_URL", "SERVER_URL", "API_BASE_URL", "RENDER_EXTERNAL_URL"});
        config.service.base_url = env.value_or("http://localhost:5000");
    }
    config.service.base_url = normalize_base_url(config.service.base_url);

    string compiler_api_url = get_env("COMPILER_API_URL", "");
    if (!compiler_api_url.empty())
        config.compiler_api.url = compiler_api_url;

    if (config.time_limit_ms <= 0)
        throw internal_error("grading.timeLimitMs must be positive");

    LOG(INFO) << "Execution service: " << config.service.base_url
              << ", compiler API: " << config.compiler_api.url
              << ", sandbox " << (config.sandbox_enabled ? "enabled" : "disabled");
}

configuration load_configuration(const filesystem::path &config_path) {
    configuration config;
    if (!config_path.empty()) {
        if (!filesystem::exists(config_path))
            throw internal_error("Unable to find configuration file " + config_path.string());
        ifstream fin(config_path);
        json j;
        fin >> j;
        j.get_to(config);
    }
    resolve_configuration(config);
    return config;
}

}  // namespace coderun

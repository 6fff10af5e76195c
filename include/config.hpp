#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace coderun {

/**
 * @brief 自建执行服务的配置
 */
struct service_config {
    /**
     * @brief 自建执行服务的根地址，比如 http://localhost:5000
     * 请求会发往 <base_url>/api/execute，末尾的 / 和 /api 会被去掉
     */
    std::string base_url;
};

void from_json(const nlohmann::json &j, service_config &config);

/**
 * @brief 第三方编译 API 的配置
 */
struct compiler_api_config {
    std::string url = "https://www.onlinegdb.com/api/v1/execute";

    /**
     * @brief 发给第三方 API 的超时上限（秒）
     */
    double max_timeout_seconds = 30;

    /**
     * @brief HTTP 请求超时在执行超时基础上额外增加的时间（毫秒）
     */
    long request_buffer_ms = 5000;

    std::string user_agent = "coderun/1.0";
};

void from_json(const nlohmann::json &j, compiler_api_config &config);

struct configuration {
    service_config service;

    compiler_api_config compiler_api;

    /**
     * @brief 是否启用本地沙箱执行 script 代码
     */
    bool sandbox_enabled = true;

    /**
     * @brief 评测时每个测试点默认的时间限制（毫秒）
     */
    int time_limit_ms = 8000;

    /**
     * @brief 模拟执行的随机数种子，为空时使用 random_device
     */
    std::optional<unsigned long long> simulation_seed;
};

void from_json(const nlohmann::json &j, configuration &config);

/**
 * @brief 去掉服务地址末尾的 / 和 /api
 * 比如 "http://host/api/" -> "http://host"
 */
std::string normalize_base_url(const std::string &url);

/**
 * @brief 在程序启动时解析一次配置
 * 配置文件中缺失的项从环境变量读取：
 * 自建执行服务地址依次读取 SELF_URL、SERVER_URL、API_BASE_URL、RENDER_EXTERNAL_URL，
 * 都不存在时使用 http://localhost:5000；COMPILER_API_URL 覆盖第三方 API 地址。
 * @param config_path 配置文件路径，为空表示不使用配置文件
 */
configuration load_configuration(const std::filesystem::path &config_path);

/**
 * @brief 补全配置中缺失的项并规范化地址
 */
void resolve_configuration(configuration &config);

}  // namespace coderun

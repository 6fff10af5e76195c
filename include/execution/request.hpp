#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

/**
 * 这个头文件包含执行后端之间共享的规范数据结构
 * 1. language（支持的语言）
 * 2. execution_request（一次执行请求）
 * 3. execution_result（所有执行器都必须返回的规范结果）
 */
namespace coderun {

enum class language {
    java,
    cpp,
    python,
    script
};

/**
 * @brief 解析语言名称，不区分大小写
 * 支持别名：c++ -> cpp，py/python3 -> python，js/javascript -> script
 * @return 不支持的语言返回 nullopt
 */
std::optional<language> parse_language(const std::string &name);

const char *to_string(language lang);

/**
 * @brief 一次执行请求，每次尝试中不可修改
 */
struct execution_request {
    std::string code;

    language lang;

    /**
     * @brief 喂给用户程序的标准输入
     */
    std::string stdin_data;

    /**
     * @brief 本次执行的时间限制（毫秒），所有执行后端都使用这个限制
     */
    int timeout_ms;
};

/**
 * @brief 规范执行结果
 * 每个执行后端和模拟执行都必须返回这个结构。
 */
struct execution_result {
    std::string stdout_data;

    /**
     * @brief 不为空表示执行层面的错误（区别于答案错误）
     */
    std::optional<std::string> stderr_data;

    std::optional<int> exit_code;

    /**
     * @brief 运行时间，格式如 "123ms"
     */
    std::string runtime;

    /**
     * @brief 内存占用，格式如 "12.3MB"、"512KB"，无法统计时为 "—"
     */
    std::string memory;

    /**
     * @brief 是否由模拟执行产生，界面需要区分显示
     */
    bool simulated = false;

    /**
     * @brief 产生该结果的执行器名称
     */
    std::string backend;
};

/**
 * @brief 无法统计内存占用时的占位符
 */
extern const char *const MEMORY_UNAVAILABLE;

void to_json(nlohmann::json &j, const execution_result &result);

/**
 * @brief 将 "123ms"、"1.5s"、"42" 这样的运行时间文本解析为毫秒数
 * @return 无法解析时返回 nullopt
 */
std::optional<long long> parse_runtime_ms(const std::string &text);

}  // namespace coderun

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace coderun {

/**
 * @brief 一个测试点
 */
struct test_case {
    std::string input;

    std::string expected_output;

    /**
     * @brief 隐藏测试点，输出结果时不显示输入和标准输出
     */
    bool hidden = false;
};

void from_json(const nlohmann::json &j, test_case &tc);

/**
 * @brief 一个测试点的执行细节
 */
struct execution_details {
    std::optional<int> exit_code;

    std::string stderr_data;

    std::string stdout_data;
};

/**
 * @brief 一个测试点的评测结果，创建后不再修改
 */
struct test_case_result {
    std::string input;

    std::string expected_output;

    std::string actual_output;

    bool passed = false;

    std::string runtime;

    std::string memory;

    /**
     * @brief 执行层面的错误信息，比如 stderr 或者执行链抛出的异常
     */
    std::optional<std::string> error;

    bool simulated = false;

    bool hidden = false;

    execution_details details;
};

void to_json(nlohmann::json &j, const test_case_result &result);

struct execution_summary {
    std::string language;

    std::size_t total_test_cases = 0;

    std::size_t passed_test_cases = 0;

    std::size_t failed_test_cases = 0;

    /**
     * @brief 由模拟执行得到结果的测试点数
     */
    std::size_t simulated_test_cases = 0;

    /**
     * @brief 评测完成时的 UNIX 毫秒时间戳
     */
    long long execution_time = 0;
};

/**
 * @brief 整个提交的评测结果
 */
struct submission_result {
    coderun::status status = coderun::status::RUNTIME_ERROR;

    std::size_t tests_passed = 0;

    std::size_t total_tests = 0;

    /**
     * @brief 每个测试点的结果，顺序与测试点顺序一致
     */
    std::vector<test_case_result> results;

    /**
     * @brief 第一个测试点的运行时间
     */
    std::string runtime = "0ms";

    /**
     * @brief 第一个测试点的内存占用
     */
    std::string memory = "0MB";

    /**
     * @brief 0 到 100 的得分，floor(100 * 通过数 / 总数)
     */
    int score = 0;

    /**
     * @brief 提交不合法或者评测过程出现异常时的错误信息
     */
    std::optional<std::string> error;

    execution_summary summary;
};

void to_json(nlohmann::json &j, const execution_summary &summary);

void to_json(nlohmann::json &j, const submission_result &result);

/**
 * @brief 评测选项
 */
struct grade_options {
    /**
     * @brief 比较模式，strict 为严格比较，其他值为宽松比较
     */
    std::string compare_mode = "strict";

    std::optional<bool> ignore_whitespace;

    std::optional<bool> ignore_case;

    /**
     * @brief 每个测试点的时间限制（毫秒），为空时使用配置中的默认值
     */
    std::optional<int> time_limit_ms;
};

void from_json(const nlohmann::json &j, grade_options &options);

}  // namespace coderun

#include "judge/submission.hpp"
#include "common/json_utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, test_case &tc) {
    tc.input = get_value_def<string>(j, "", "input");
    tc.expected_output = get_value_def<string>(j, "", "expectedOutput");
    tc.hidden = get_value_def(j, false, "hidden");
}

void to_json(json &j, const test_case_result &result) {
    j = {{"actualOutput", result.actual_output},
         {"passed", result.passed},
         {"runtime", result.runtime},
         {"memory", result.memory},
         {"simulated", result.simulated},
         {"executionDetails",
          {{"exitCode", result.details.exit_code ? json(*result.details.exit_code) : json(nullptr)},
           {"stderr", result.details.stderr_data},
           {"stdout", result.details.stdout_data}}}};
    j["error"] = result.error ? json(*result.error) : json(nullptr);

    if (!result.hidden) {
        j["input"] = result.input;
        j["expectedOutput"] = result.expected_output;
    } else {
        j["hidden"] = true;
    }
}

void to_json(json &j, const execution_summary &summary) {
    j = {{"language", summary.language},
         {"totalTestCases", summary.total_test_cases},
         {"passedTestCases", summary.passed_test_cases},
         {"failedTestCases", summary.failed_test_cases},
         {"simulatedTestCases", summary.simulated_test_cases},
         {"executionTime", summary.execution_time}};
}

void to_json(json &j, const submission_result &result) {
    j = {{"status", get_display_message(result.status)},
         {"testsPassed", result.tests_passed},
         {"totalTests", result.total_tests},
         {"results", result.results},
         {"runtime", result.runtime},
         {"memory", result.memory},
         {"score", result.score},
         {"executionSummary", result.summary}};
    if (result.error)
        j["error"] = *result.error;
}

void from_json(const json &j, grade_options &options) {
    options.compare_mode = get_value_def<string>(j, "strict", "compareMode");
    if (exists(j, "ignoreWhitespace"))
        options.ignore_whitespace = j.at("ignoreWhitespace").get<bool>();
    if (exists(j, "ignoreCase"))
        options.ignore_case = j.at("ignoreCase").get<bool>();
    // 非正数的时间限制视为未设置
    if (auto time_limit = get_int(j, "timeLimit"); time_limit && *time_limit > 0)
        options.time_limit_ms = *time_limit;
    else if (auto time_limit_ms = get_int(j, "timeLimitMs"); time_limit_ms && *time_limit_ms > 0)
        options.time_limit_ms = *time_limit_ms;
}

}  // namespace coderun

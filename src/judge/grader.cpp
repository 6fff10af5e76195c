#include "judge/grader.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace coderun {
using namespace std;

language validate_submission(const string &code, const string &lang, const vector<test_case> &test_cases) {
    auto parsed = parse_language(lang);
    if (!parsed || *parsed == language::script)
        throw validation_error(fmt::format("Unsupported language: {}. Only Java, C++, and Python are supported.", lang));

    // 这些代码必然无法编译，直接拒绝
    if (*parsed == language::java && code.find("class") == string::npos)
        throw validation_error("Java code must include a class definition");
    if (*parsed == language::cpp && code.find("main(") == string::npos)
        throw validation_error("C++ code must include a main function");

    if (test_cases.empty())
        throw validation_error("No test cases provided for execution");

    for (auto &tc : test_cases)
        if (tc.input.empty() || tc.expected_output.empty())
            throw validation_error("Invalid test case: input and expectedOutput are required");

    return *parsed;
}

static bool error_contains(const test_case_result &result, const string &keyword) {
    return result.error && boost::algorithm::icontains(*result.error, keyword);
}

status derive_status(const vector<test_case_result> &results) {
    size_t passed = 0;
    for (auto &result : results)
        if (result.passed) ++passed;

    if (!results.empty() && passed == results.size()) return status::ACCEPTED;
    if (passed == 0) return status::WRONG_ANSWER;

    for (auto &result : results)
        if (!result.passed && error_contains(result, "timeout"))
            return status::TIME_LIMIT_EXCEEDED;
    for (auto &result : results)
        if (!result.passed && error_contains(result, "compilation"))
            return status::COMPILATION_ERROR;
    return status::WRONG_ANSWER;
}

grader::grader(const execution_chain &chain, int default_time_limit_ms)
    : chain(chain), default_time_limit_ms(default_time_limit_ms) {}

test_case_result grader::run_test_case(const execution_request &request, const test_case &tc, const comparison_options &options) const {
    test_case_result result;
    result.input = tc.input;
    result.expected_output = tc.expected_output;
    result.hidden = tc.hidden;

    try {
        execution_result execution = chain.execute_best_effort(request);
        result.actual_output = execution.stdout_data;
        result.passed = outputs_match(execution.stdout_data, tc.expected_output, options);
        result.runtime = execution.runtime;
        result.memory = execution.memory;
        result.error = execution.stderr_data;
        result.simulated = execution.simulated;
        result.details = {execution.exit_code, execution.stderr_data.value_or(""), execution.stdout_data};
    } catch (std::exception &ex) {
        LOG(WARNING) << "Test case execution failed: " << ex.what();
        result.passed = false;
        result.runtime = "0ms";
        result.memory = "0MB";
        result.error = ex.what();
        result.details = {-1, ex.what(), ""};
    }
    return result;
}

submission_result grader::grade(const string &code, const string &lang, const vector<test_case> &test_cases,
                                const grade_options &options) const {
    submission_result submission;
    submission.total_tests = test_cases.size();
    submission.summary.language = lang;
    submission.summary.total_test_cases = test_cases.size();

    try {
        language parsed = validate_submission(code, lang, test_cases);
        submission.summary.language = to_string(parsed);

        comparison_options comparison = make_comparison_options(options.compare_mode, options.ignore_whitespace, options.ignore_case);
        int time_limit_ms = options.time_limit_ms.value_or(0) > 0 ? *options.time_limit_ms : default_time_limit_ms;
        execution_request request{code, parsed, "", time_limit_ms};

        LOG(INFO) << "Grading " << to_string(parsed) << " submission with " << test_cases.size() << " test cases";

        for (size_t i = 0; i < test_cases.size(); ++i) {
            request.stdin_data = test_cases[i].input;
            test_case_result result = run_test_case(request, test_cases[i], comparison);
            LOG(INFO) << "Test case " << i + 1 << ": " << (result.passed ? "passed" : "failed")
                      << (result.simulated ? " (simulated)" : "");
            if (result.passed) ++submission.tests_passed;
            if (result.simulated) ++submission.summary.simulated_test_cases;
            submission.results.push_back(move(result));
        }

        submission.status = derive_status(submission.results);
        submission.score = (int)(submission.tests_passed * 100 / submission.total_tests);
        if (!submission.results.empty()) {
            submission.runtime = submission.results.front().runtime;
            submission.memory = submission.results.front().memory;
        }

        LOG(INFO) << submission.tests_passed << "/" << submission.total_tests << " tests passed ("
                  << submission.score << "%)";
    } catch (std::exception &ex) {
        LOG(ERROR) << "Grading failed: " << ex.what();
        submission.status = status::RUNTIME_ERROR;
        submission.tests_passed = 0;
        submission.score = 0;
        submission.results.clear();
        submission.runtime = "0ms";
        submission.memory = "0MB";
        submission.error = ex.what();
    }

    submission.summary.passed_test_cases = submission.tests_passed;
    submission.summary.failed_test_cases = submission.total_tests - submission.tests_passed;
    submission.summary.execution_time = epoch_milliseconds();
    return submission;
}

}  // namespace coderun

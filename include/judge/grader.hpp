#pragma once

#include <string>
#include <vector>
#include "execution/chain.hpp"
#include "judge/comparison.hpp"
#include "judge/submission.hpp"

namespace coderun {

/**
 * @brief 检查提交是否可以评测，检查通过之前不会调用任何执行器
 * 1. 语言只能是 java、cpp、python；
 * 2. java 代码必须包含 class，cpp 代码必须包含 main(；
 * 3. 至少有一个测试点，且每个测试点的输入和标准输出都不为空。
 *
 * @return 解析后的语言
 * @throw validation_error 提交不合法
 */
language validate_submission(const std::string &code, const std::string &lang, const std::vector<test_case> &test_cases);

/**
 * @brief 根据各个测试点的结果计算提交状态
 * 全部通过为 Accepted；一个都没有通过一律为 Wrong Answer；
 * 否则失败测试点的错误信息中包含 timeout 为 Time Limit Exceeded，包含 compilation 为 Compilation Error，
 * 其余为 Wrong Answer。
 */
status derive_status(const std::vector<test_case_result> &results);

/**
 * @brief 逐个测试点调用执行链并比较输出，汇总成提交结果
 */
struct grader {
    /**
     * @param chain 执行链，由调用者持有，生命周期必须长于 grader
     * @param default_time_limit_ms 提交没有指定时间限制时使用的时间限制
     */
    grader(const execution_chain &chain, int default_time_limit_ms);

    /**
     * @brief 评测一个提交
     * 该函数不会抛出异常：提交不合法或者评测过程中出现的异常都会变成 Runtime Error 的结果。
     * 测试点依次执行，某个测试点失败不会影响后续测试点。
     */
    submission_result grade(const std::string &code, const std::string &lang, const std::vector<test_case> &test_cases,
                            const grade_options &options) const;

private:
    test_case_result run_test_case(const execution_request &request, const test_case &tc, const comparison_options &options) const;

    const execution_chain &chain;
    int default_time_limit_ms;
};

}  // namespace coderun

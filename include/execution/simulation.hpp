#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "execution/request.hpp"

namespace coderun {

/**
 * @brief 随机数来源，每次调用返回 [0, 1) 内均匀分布的数
 * 测试时可以替换为固定序列以得到确定的结果
 */
typedef std::function<double()> random_source;

/**
 * @brief 基于 mt19937_64 的随机数来源
 * @param seed 随机数种子，为空时使用 random_device
 */
random_source make_random_source(std::optional<unsigned long long> seed = std::nullopt);

/**
 * @brief 模拟执行时可能随机产生的失败信息
 */
extern const std::vector<std::string> SIMULATED_FAILURES;

/**
 * @brief 代码中是否包含该语言的程序入口
 */
bool has_entry_point(const std::string &code, language lang);

/**
 * @brief 粗略的语法检查
 * @return 第一个语法问题的描述，没有问题时返回 nullopt
 */
std::optional<std::string> check_basic_syntax(const std::string &code, language lang);

/**
 * @brief 粗略的代码质量评分，范围 [0, 1]
 * 基础分 0.7，有程序入口 +0.2，长度合理 +0.1，包含常见控制流关键字 +0.1
 */
double analyze_code_quality(const std::string &code, language lang);

/**
 * @brief 根据代码中的关键字和输入数据中的数字构造看起来合理的输出
 */
std::string synthesize_output(const std::string &input, const std::string &code);

/**
 * @brief 在所有真实执行后端都不可用时使用的模拟执行
 * 这不是真正的解释器：它只检查代码的表面结构，按照代码质量评分随机决定成功或者失败，
 * 然后通过模式匹配构造输出。结果的 simulated 为 true，界面需要提示用户。
 *
 * @param rng 随机数来源
 * @throw execution_error 代码为空、缺少程序入口、存在语法问题，或者随机到了失败分支
 */
execution_result simulate(const std::string &code, language lang, const std::string &stdin_data, const random_source &rng);

/**
 * @brief 模拟执行器，通常是执行链的最后一环
 */
struct simulation_executor {
    explicit simulation_executor(random_source rng);

    std::string name() const;

    execution_result execute(const execution_request &request) const;

private:
    random_source rng;
};

}  // namespace coderun

#pragma once

#include <optional>
#include <string>

namespace coderun {

/**
 * @brief 输出比较选项，整个提交内不变
 */
struct comparison_options {
    /**
     * @brief 是否将连续空白视为一个空格并去掉首尾空白
     */
    bool ignore_whitespace = false;

    /**
     * @brief 是否忽略大小写
     */
    bool ignore_case = false;
};

/**
 * @brief 根据比较模式构造比较选项
 * strict 模式下默认两项都关闭，其他模式下默认两项都开启，显式给出的值优先
 */
comparison_options make_comparison_options(const std::string &compare_mode,
                                           std::optional<bool> ignore_whitespace = std::nullopt,
                                           std::optional<bool> ignore_case = std::nullopt);

/**
 * @brief 规范化程序输出
 * 1. 将 \r\n 和单独的 \r 统一为 \n，去掉末尾的换行；
 * 2. ignore_whitespace 时将连续空白合并为一个空格并去掉首尾空白；
 * 3. ignore_case 时转为小写。
 * 对同一组选项，normalize(normalize(x)) == normalize(x)。
 */
std::string normalize(const std::string &text, const comparison_options &options);

bool outputs_match(const std::string &actual, const std::string &expected, const comparison_options &options);

}  // namespace coderun

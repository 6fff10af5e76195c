#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace coderun {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 按顺序查找第一个非空的环境变量
 * @param keys 环境变量的键，越靠前优先级越高
 * @return 第一个非空的环境变量值，都不存在时返回 nullopt
 */
std::optional<std::string> first_env(const std::vector<std::string> &keys);

/**
 * @brief 将文本按 \n 或 \r\n 切分成行
 * 与 boost::split 不同，"a\n" 会得到 ["a", ""]，和读取 stdin 时的行为一致
 */
std::vector<std::string> split_lines(const std::string &text);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

/**
 * @brief 当前时间的 UNIX 毫秒时间戳
 */
long long epoch_milliseconds();

}  // namespace coderun

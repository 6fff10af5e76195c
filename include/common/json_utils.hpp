#pragma once

#include <boost/lexical_cast.hpp>
#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace nlohmann {

/**
 * @brief 按键路径查找 json 节点
 * @return 节点指针，路径中任意一段不存在或者不是对象时返回 nullptr
 */
template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    ((ref = (ref && ref->is_object() && ref->count(keys)) ? &ref->at(keys) : nullptr), ...);
    return ref;
}

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
json access_optional(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    return !ref ? json{} : *ref;
}

template <typename T, typename... Keys>
const T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    json res = access_optional(j, keys...);
    if (res.is_null()) return def_value;
    try {
        return res.get<T>();
    } catch (json::exception &) {
        return def_value;
    }
}

/**
 * @brief 读取字符串节点
 * @return 节点存在且为字符串时返回其值，否则返回 nullopt
 */
template <typename... Keys>
std::optional<std::string> get_string(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref || !ref->is_string()) return std::nullopt;
    return ref->get<std::string>();
}

/**
 * @brief 读取整数节点，兼容数字和数字字符串
 * 浮点数只有在 long long 范围内时才会被截断为整数
 * @return 节点不存在或者无法解析为整数时返回 nullopt
 */
template <typename... Keys>
std::optional<long long> get_integer(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref) return std::nullopt;
    if (ref->is_number_integer()) {
        if (ref->is_number_unsigned() && ref->get<unsigned long long>() > (unsigned long long)std::numeric_limits<long long>::max())
            return std::nullopt;
        return ref->get<long long>();
    }
    if (ref->is_number_float()) {
        double value = ref->get<double>();
        // 2^63 本身不能表示为 long long
        if (!std::isfinite(value) || value < -9223372036854775808.0 || value >= 9223372036854775808.0)
            return std::nullopt;
        return (long long)value;
    }
    if (ref->is_string()) {
        try {
            return boost::lexical_cast<long long>(ref->get<std::string>());
        } catch (boost::bad_lexical_cast &) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

/**
 * @brief 读取 int 范围内的整数节点
 * @return 节点不存在、无法解析或者超出 int 范围时返回 nullopt
 */
template <typename... Keys>
std::optional<int> get_int(const json &j, Keys &&... keys) {
    auto value = get_integer(j, keys...);
    if (!value || *value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max())
        return std::nullopt;
    return (int)*value;
}

}  // namespace nlohmann

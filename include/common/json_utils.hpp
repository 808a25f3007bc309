#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

inline const json *find_path(const json &j) {
    return j.is_null() ? nullptr : &j;
}

/**
 * @brief 按 keys 逐层查找 json 对象中的值
 * @return 找到时返回指向该值的指针，路径不存在或值为 null 时返回 nullptr
 */
template <typename Key, typename... Keys>
const json *find_path(const json &j, const Key &key, const Keys &... keys) {
    if (!j.is_object()) return nullptr;
    auto it = j.find(key);
    if (it == j.end()) return nullptr;
    return find_path(*it, keys...);
}

template <typename... Keys>
bool exists(const json &j, const Keys &... keys) {
    return find_path(j, keys...) != nullptr;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, const Keys &... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, const Keys &... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

template <typename T, typename... Keys>
T get_value(const json &j, const Keys &... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 读取可选的值
 * @param def_value 路径不存在或值为 null 时返回的默认值
 * @throw std::invalid_argument 值存在但类型不正确
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, const Keys &... keys) {
    const json *res = find_path(j, keys...);
    if (!res) return def_value;
    try {
        return res->get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

}  // namespace nlohmann

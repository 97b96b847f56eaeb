#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref && !ref->is_null() ? ref : nullptr;
}

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    return find_path(j, keys...) != nullptr;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    return std::invalid_argument(msg);
}

/**
 * @brief 读取配置项，键不存在或为 null 时返回 def_value
 * @throw std::invalid_argument 若配置项存在但类型不正确
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *res = find_path(j, keys...);
    if (!res) return def_value;
    try {
        return res->get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(keys...);
    }
}

/**
 * @brief 若配置项存在，将其赋值给 value，否则保持 value 不变
 * @throw std::invalid_argument 若配置项存在但类型不正确
 */
template <typename T, typename... Keys>
void assign_optional(const json &j, T &value, Keys &&... keys) {
    value = get_value_def<T>(j, value, keys...);
}

}  // namespace nlohmann

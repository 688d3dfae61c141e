#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace nlohmann {

/**
 * @brief 按 keys 逐层查找 j 中的字段
 * @return 找到的字段，不存在或者中间某一层不是 object 时返回 nullptr
 */
template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->contains(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

/**
 * @brief 读取可选字段
 * @return 字段不存在、为 null 或者类型不匹配时返回 std::nullopt
 */
template <typename T, typename... Keys>
std::optional<T> get_optional(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref || ref->is_null()) return std::nullopt;
    try {
        return ref->get<T>();
    } catch (json::type_error &) {
        return std::nullopt;
    }
}

}  // namespace nlohmann

#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

/**
 * 对源代码的静态检查。
 * 只做逐字符扫描的浅层匹配：只看第一次赋值，不区分作用域，也不执行任何代码。
 * 变量名按字面匹配并且区分大小写，空的变量名不匹配任何赋值。
 * 即使程序运行失败或者超时，这些检查依然可以进行。
 */
namespace runner {

/**
 * @brief 源代码中是否存在形如 "variable =" 的赋值，variable 前必须是单词边界
 */
bool has_assignment(const std::string &source, const std::string &variable);

/**
 * @brief 查找 variable 的第一次赋值，variable 前不要求单词边界
 * 赋值号两侧的空白可以跨行，取值到行尾为止
 * @return 赋值号右侧到行尾的文本（已去除首尾空白），找不到时返回 std::nullopt
 */
std::optional<std::string> find_first_assignment(const std::string &source, const std::string &variable);

/**
 * @brief 根据字面量的写法推断类型，按顺序匹配：
 * 1. 单引号或双引号包围 -> string
 * 2. 全部是数字 -> integer
 * 3. 数字.数字 -> float
 * 4. [...] -> list
 * 5. {...} -> dict
 * 6. 其他 -> unknown
 */
std::string infer_literal_type(const std::string &literal);

/**
 * @brief 判断推断出的类型名与期望的类型名是否一致
 * 期望类型可以使用 Python 的写法 str 和 int
 */
bool type_name_matches(const std::string &inferred, const std::string &expected);

/**
 * @brief 查找 variable 第一次被赋值为列表字面量的位置
 * @return 方括号内的原始文本（不去除空白），找不到时返回 std::nullopt
 */
std::optional<std::string> find_list_literal(const std::string &source, const std::string &variable);

/**
 * @brief 列表字面量中逗号分隔的非空元素个数
 */
std::size_t count_list_items(const std::string &contents);

/**
 * @brief 将 JSON 值转换成 Python str() 的写法
 * 字符串保持原样，布尔值为 True/False，null 为 None，其他值使用 JSON 文本
 */
std::string python_str(const nlohmann::json &value);

/**
 * @brief 将 JSON 值编码成 ASCII 转义的 JSON 文本，分隔符与 Python json.dumps 相同
 */
std::string json_token(const nlohmann::json &value);

}  // namespace runner

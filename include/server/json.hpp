#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "judge/result.hpp"
#include "judge/test_spec.hpp"
#include "server/run_service.hpp"

/**
 * JSON 与请求、结果结构体之间的转换。
 * 字段名与 HTTP 接口保持一致：testResults, executionTimeMs, allPassed, expectedType
 */
namespace runner {

/**
 * @brief 读取一条测试
 * 字段类型不对时视为缺失，由评测器给出对应的失败结果，不会使整个请求失败
 * @throw bad_request 若 j 不是 object
 */
void from_json(const nlohmann::json &j, test_spec &spec);

/**
 * @brief 缺失的 description 输出为 null；expected、actual、error 只在存在时输出
 */
void to_json(nlohmann::json &j, const test_verdict &verdict);

void to_json(nlohmann::json &j, const run_result &result);

}  // namespace runner

namespace runner::server {

/**
 * @brief 解析 POST /run 的请求体
 * 嵌套超过 64 层的请求体视为不合法
 * @throw bad_request 请求体不是合法的 JSON object ("Invalid JSON")，
 *        缺少代码 ("No code provided")，或者 tests 不是数组 ("Invalid tests")
 */
run_request parse_run_request(const std::string &body);

/**
 * @brief 序列化为 JSON 文本
 * 用户程序的输出可能不是合法的 UTF-8，非法字节会被替换为 U+FFFD
 */
std::string dump_json(const nlohmann::json &j);

}  // namespace runner::server

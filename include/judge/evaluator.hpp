#pragma once

#include <optional>
#include <string>
#include <vector>
#include "judge/test_spec.hpp"
#include "sandbox/outcome.hpp"

namespace runner {

/**
 * @brief 支持的测试类型
 */
enum class test_kind {
    output,           // stdout 与期望值完全一致
    variable_exists,  // 源代码中存在对变量的赋值
    variable_type,    // 第一次赋值的字面量类型
    variable_value,   // 第一次赋值的字面量文本
    function_call,    // stdout 中某一行与期望值一致
    list_contains,    // 列表字面量中包含期望元素
    list_length       // 列表字面量的元素个数
};

/**
 * @brief 将请求中的类型字符串转换为 test_kind
 * @return 未知类型返回 std::nullopt
 */
std::optional<test_kind> parse_test_kind(const std::string &type);

/**
 * @brief 评测一条测试时可以使用的输入
 */
struct evaluation_context {
    /**
     * @brief 用户提交的源代码
     */
    const std::string &source;

    /**
     * @brief 本次请求唯一的执行结果
     */
    const execution_outcome &outcome;
};

/**
 * @brief 评测策略，每种 test_kind 对应一个
 * 策略都是无状态的纯函数，一条测试的结果不依赖于其他测试
 */
typedef test_verdict (*evaluation_strategy)(const test_spec &spec, const evaluation_context &ctx);

/**
 * @brief 返回 kind 对应的评测策略
 */
evaluation_strategy strategy_for(test_kind kind);

/**
 * @brief 评测一条测试
 * 若 stderr 非空并且 stdout 为空，说明程序没有正常运行，测试直接判为失败
 */
test_verdict evaluate_test(const evaluation_context &ctx, const test_spec &spec);

/**
 * @brief 按输入顺序评测所有测试，每条测试产生一个结果
 */
std::vector<test_verdict> evaluate(const std::string &source, const execution_outcome &outcome, const std::vector<test_spec> &specs);

}  // namespace runner

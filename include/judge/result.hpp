#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "judge/test_spec.hpp"
#include "sandbox/outcome.hpp"

namespace runner {

/**
 * @brief 一次 /run 请求的完整结果
 */
struct run_result {
    /**
     * @brief 运行流程本身是否完成，与测试是否通过无关
     */
    bool success = true;

    std::string stdout_text;

    /**
     * @brief 启动失败时为 "Execution error: <原因>"
     */
    std::string stderr_text;

    /**
     * @brief 与请求中的测试一一对应
     */
    std::vector<test_verdict> test_results;

    /**
     * @brief 执行器耗时（毫秒），不包括评测测试的时间
     */
    std::int64_t execution_time_ms = 0;

    /**
     * @brief 所有测试是否都通过，没有测试时为 true
     */
    bool all_passed = true;
};

/**
 * @brief 汇总执行结果和测试结果
 */
run_result aggregate(const execution_outcome &outcome, std::vector<test_verdict> verdicts, std::int64_t execution_time_ms);

}  // namespace runner

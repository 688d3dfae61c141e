#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace runner {

/**
 * @brief 一次执行的结果
 * 由执行器构造，返回之后不再修改。同一个请求内的所有测试共享这个结果
 */
struct execution_outcome {
    /**
     * @brief 标准输出，已去除首尾空白字符
     * 超出 max_output_bytes 时被截断并追加截断提示
     */
    std::string stdout_text;

    /**
     * @brief 标准错误，处理方式同 stdout_text
     */
    std::string stderr_text;

    /**
     * @brief 是否因为超出时钟时间上限而被杀死
     */
    bool timed_out = false;

    bool truncated_stdout = false;

    bool truncated_stderr = false;

    /**
     * @brief 执行单元从启动到结束的时钟时间（毫秒）
     */
    std::int64_t duration_ms = 0;

    /**
     * @brief 无法创建执行单元时的错误信息
     * 此时 stdout_text 和 stderr_text 均为空
     */
    std::optional<std::string> launch_error;

    /**
     * @brief 评测和返回给调用方时使用的 stderr
     * 启动失败时为 "Execution error: <launch_error>"，否则为 stderr_text
     */
    std::string effective_stderr() const;
};

/**
 * @brief 超时时使用的 stderr 文本
 */
std::string timeout_message(const std::string &limit_seconds);

extern const char STDOUT_TRUNCATED_SENTINEL[];
extern const char STDERR_TRUNCATED_SENTINEL[];

}  // namespace runner

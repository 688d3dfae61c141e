#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace runner {

/**
 * @brief 执行策略常量
 * 所有值都是硬上限。进程生命周期内只读，不允许按请求覆盖
 */
struct resource_limits {
    /**
     * @brief 时钟时间上限（毫秒）
     * 超时后执行单元会被立刻杀死，不提供额外的宽限时间
     */
    std::int64_t max_wall_time_ms = 2000;

    /**
     * @brief stdout 和 stderr 各自最多保留的字节数
     */
    std::size_t max_output_bytes = 1 << 20;  // 1MB

    /**
     * @brief 源代码最大字节数
     */
    std::size_t max_source_bytes = 100 << 10;  // 100KB

    /**
     * @brief 用户程序的地址空间上限（字节），0 表示不限制
     */
    std::size_t max_memory_bytes = std::size_t(512) << 20;

    /**
     * @brief RLIMIT_NPROC，0 表示不限制
     * 注意 RLIMIT_NPROC 按用户统计，只有在 run_user 专用时才适合打开
     */
    std::size_t max_processes = 0;

    /**
     * @brief 用户程序能写出的单个文件最大字节数，0 表示与 max_output_bytes 相同
     */
    std::size_t max_file_bytes = 0;
};

/**
 * @brief 在执行之前检查源代码长度
 * 只比较字节数，不会分配任何沙箱资源
 * @throw source_too_large 若 source 超过 max_source_bytes
 */
void check_source_size(const std::string &source, const resource_limits &limits);

/**
 * @brief 超时信息中显示的秒数，例如 2000ms 显示为 "2"，1500ms 显示为 "1.5"
 */
std::string format_wall_limit(const resource_limits &limits);

/**
 * @brief 交给 RLIMIT_CPU 的 CPU 时间上限（秒）
 * 时钟时间上限向上取整后再加一秒，保证内核不会比执行器先杀死程序，
 * 执行器出现延迟时由内核兜底
 */
std::int64_t cpu_limit_seconds(const resource_limits &limits);

}  // namespace runner

#pragma once

#include <string>
#include "sandbox/backend.hpp"
#include "sandbox/limits.hpp"

namespace runner {

/**
 * @brief 沙箱执行器
 * 对每份代码创建一个新的执行单元，在资源限制下执行，返回 execution_outcome。
 * 选手代码导致的任何失败（超时、崩溃、无法启动）都记录在结果里，不会抛出。
 */
struct sandbox_executor {
    sandbox_executor(execution_backend &backend, const resource_limits &limits);

    /**
     * @brief 执行一份代码
     * 调用方需要先通过 check_source_size 检查代码长度
     * @param source 选手代码
     * @return 执行结果。后端出现宿主机错误（无论是启动时还是等待时）都记录在 launch_error 中
     */
    execution_outcome execute(const std::string &source) const;

private:
    execution_backend &backend;
    const resource_limits &limits;
};

}  // namespace runner

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "sandbox/outcome.hpp"

namespace runner {

/**
 * @brief 一个执行单元
 * 只用来运行一份代码，运行结束后丢弃，不会在请求之间复用。
 * 具体内容（进程、容器、虚拟机）由后端决定
 */
struct execution_unit {
    virtual ~execution_unit();
};

/**
 * @brief 执行后端，表示一种隔离方式
 * 目前只有基于进程的 process_backend，更强的隔离方式（命名空间、容器、
 * micro-VM）实现这个接口即可替换，评测逻辑不需要改动。
 *
 * 执行器对每个执行单元的调用顺序为：
 * launch -> wait -> cleanup，wait 抛出异常时会先调用 kill 再调用 cleanup。
 * 实现需要保证并发调用是安全的。
 */
struct execution_backend {
    virtual ~execution_backend();

    /**
     * @brief 创建执行单元并开始执行
     * @param source 选手代码
     * @return 新的执行单元
     * @throw launch_error 无法创建执行单元
     */
    virtual std::unique_ptr<execution_unit> launch(const std::string &source) = 0;

    /**
     * @brief 等待执行单元结束，或者在 deadline 到达时杀死它
     * @param unit launch 返回的执行单元
     * @param deadline 时钟时间上限
     * @return 执行结果
     */
    virtual execution_outcome wait(execution_unit &unit, std::chrono::steady_clock::time_point deadline) = 0;

    /**
     * @brief 立刻终止执行单元（包括它产生的子进程）
     */
    virtual void kill(execution_unit &unit) = 0;

    /**
     * @brief 释放执行单元占用的全部资源，包括临时文件
     * 必须可以重复调用，不能抛出异常
     */
    virtual void cleanup(execution_unit &unit) noexcept = 0;
};

}  // namespace runner

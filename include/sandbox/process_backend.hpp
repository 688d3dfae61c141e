#pragma once

#include <sys/types.h>
#include <chrono>
#include <optional>
#include <string>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "sandbox/backend.hpp"
#include "sandbox/limits.hpp"

namespace runner {

/**
 * @brief 用户程序放进独立 pid 命名空间的方式
 */
enum class pid_isolation {
    none,           // 不可用，只能依靠进程组清理后代进程
    privileged,     // 服务以 root 运行，直接 unshare(CLONE_NEWPID)
    user_namespace  // 与用户命名空间一起创建
};

/**
 * @brief 基于进程的执行单元
 * 一个独立的会话和进程组、两条输出管道、一个临时目录。
 * 析构时会杀死整个进程组、回收子进程、关闭管道并删除临时目录。
 */
struct process_unit : public execution_unit {
    ~process_unit() override;

    /**
     * @brief 杀死进程组并回收子进程，可以重复调用
     */
    void terminate() noexcept;

    /**
     * @brief 释放全部资源：进程、管道、临时目录
     */
    void release() noexcept;

    scoped_scratch_dir scratch;

    /**
     * @brief 子进程 pid，同时也是进程组 id
     * 启用 pid 命名空间时，这是等待命名空间 1 号进程的中间进程
     */
    pid_t pid = -1;

    /**
     * @brief 子进程是否已经被 waitpid 回收
     */
    bool reaped = false;

    int status = 0;

    scoped_fd stdout_pipe;

    scoped_fd stderr_pipe;

    std::chrono::steady_clock::time_point start;
};

/**
 * @brief 以子进程运行解释器的执行后端
 * 1. 为每次执行创建 run-<uuid> 临时目录，写入 main.py
 * 2. fork 出子进程：
 *    1. setsid 使子进程成为新的进程组组长，以便通过一个信号杀死它产生的所有进程
 *    2. stdin 重定向到 /dev/null，stdout/stderr 重定向到管道
 *    3. 工作路径设置为临时目录，清空环境变量，只保留 PATH
 *    4. 通过 rlimit 限制 CPU 时间、地址空间、文件大小、进程数，禁止 core dump
 *    5. 以 root 运行时切换到 run_user
 *    6. 尝试 unshare 出独立的用户和网络命名空间，禁止访问网络
 *    7. 尝试 unshare 出独立的 pid 命名空间并再 fork 一次，解释器作为 1 号进程，
 *       它退出时内核会杀死命名空间内的所有后代进程
 *    8. 设置 PR_SET_NO_NEW_PRIVS，禁止通过 setuid 程序提权
 *    子进程在 exec 之前出现的错误通过带 CLOEXEC 的错误管道传回父进程
 * 3. 父进程通过 poll 读取管道，超出 max_output_bytes 的部分读出后丢弃，
 *    到达 deadline 时 SIGKILL 整个进程组
 */
struct process_backend : public execution_backend {
    process_backend(const resource_limits &limits, const sandbox_options &options);

    std::unique_ptr<execution_unit> launch(const std::string &source) override;

    execution_outcome wait(execution_unit &unit, std::chrono::steady_clock::time_point deadline) override;

    void kill(execution_unit &unit) override;

    void cleanup(execution_unit &unit) noexcept override;

    /**
     * @brief 当前系统是否允许子进程建立独立的网络命名空间
     * 在构造时 fork 一个进程试探一次
     */
    bool network_isolation_available() const;

    /**
     * @brief 当前系统是否允许子进程建立独立的 pid 命名空间
     */
    bool process_isolation_available() const;

private:
    const resource_limits &limits;
    const sandbox_options &options;

    /**
     * @brief 子进程切换到的用户，std::nullopt 表示不切换
     */
    std::optional<std::pair<uid_t, gid_t>> run_as;

    bool can_isolate_network;

    pid_isolation pid_mode;
};

}  // namespace runner

#pragma once

#include <string>
#include <vector>
#include "config.hpp"
#include "judge/result.hpp"
#include "judge/test_spec.hpp"
#include "sandbox/backend.hpp"
#include "sandbox/executor.hpp"

namespace runner::server {

/**
 * @brief 解析后的 POST /run 请求
 */
struct run_request {
    /**
     * @brief 用户提交的源代码，非空
     */
    std::string code;

    std::vector<test_spec> tests;
};

/**
 * @brief 一次运行的完整流程：检查长度、执行、评测、汇总
 * 不保存任何请求相关的状态，可以被多个线程同时调用
 */
struct run_service {
    run_service(const configuration &config, execution_backend &backend);

    /**
     * @brief 执行代码并评测所有测试
     * 用户程序的错误不会抛出异常，而是体现在返回结果中
     * @throw source_too_large 代码超出 max_source_bytes，此时不会分配任何沙箱资源
     */
    run_result run(const run_request &request) const;

private:
    const configuration &cfg;
    sandbox_executor executor;
};

}  // namespace runner::server

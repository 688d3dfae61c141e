#pragma once

#include <boost/stacktrace.hpp>
#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace runner {

struct runner_exception : std::exception {
    explicit runner_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runner_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示运行服务自身的内部错误
 * 与提交的代码无关，通常是宿主机的问题，最终会返回 500
 */
struct internal_error : public runner_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 无法创建执行单元
 * 比如解释器不存在、fork 失败、无法创建临时目录。
 * 执行器会把这个错误记录到 execution_outcome::launch_error 中，不会继续向上抛出
 */
struct launch_error : public runner_exception {
    explicit launch_error(const std::string &message);
};

/**
 * @brief 源代码超出 max_source_bytes
 * 在分配任何沙箱资源之前抛出
 */
struct source_too_large : public runner_exception {
    source_too_large(std::size_t size, std::size_t limit);

    std::size_t size;
    std::size_t limit;
};

/**
 * @brief 请求格式不正确（缺少代码、JSON 无法解析等）
 */
struct bad_request : public runner_exception {
    explicit bad_request(const std::string &message);
};

}  // namespace runner

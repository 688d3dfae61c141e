#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "sandbox/limits.hpp"

namespace runner {

/**
 * @brief 沙箱后端的运行配置
 */
struct sandbox_options {
    /**
     * @brief 执行选手代码的解释器，可以是绝对路径或者 PATH 中的命令名
     */
    std::string interpreter = "python3";

    /**
     * @brief 执行单元临时目录的根目录
     * 每次执行都会在这里创建 run-<uuid> 目录，执行结束后删除
     *
     * SCRATCH_DIR
     * ├── run-ABCDEFG // 一个执行单元
     * │   └── main.py // 选手代码
     * └── ...
     */
    std::filesystem::path scratch_dir;

    /**
     * @brief 以 root 运行时，用户程序切换到的用户
     * 为空时用户程序保留 root 身份，strict_isolation 打开时拒绝执行
     */
    std::optional<std::string> run_user;

    /**
     * @brief 是否尝试把用户程序放进独立的网络命名空间
     */
    bool isolate_network = true;

    /**
     * @brief 为真时，无法建立网络或 pid 命名空间、或者以 root 身份运行用户程序都视为启动失败
     * 为假时只记录警告，继续执行
     */
    bool strict_isolation = false;
};

/**
 * @brief 运行服务的全部配置
 * 在进程启动时构造一次，之后只读，以 const 引用传给各个组件
 */
struct configuration {
    std::string host = "0.0.0.0";

    unsigned short port = 8080;

    resource_limits limits;

    sandbox_options sandbox;
};

/**
 * @brief 根据命令行参数和环境变量构造配置
 * 优先级：命令行参数 > 环境变量 > 默认值
 * @return 解析好的配置；若用户请求了 --help 或 --version，返回 std::nullopt
 * @throw boost::program_options::error 参数不合法
 */
std::optional<configuration> parse_configuration(int argc, const char *const argv[]);

}  // namespace runner

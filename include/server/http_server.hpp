#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <set>
#include "server/run_service.hpp"

namespace runner::server {

/**
 * @brief HTTP 服务
 * 主线程上的 io_context 负责接受连接和处理 SIGINT/SIGTERM，
 * 每个连接在独立的线程上使用同步的 Boost.Beast 读写，支持 keep-alive。
 * 用户程序的执行本身是阻塞的，一个连接同时只处理一个请求
 */
struct http_server {
    /**
     * @brief 绑定并监听 host:port
     * @throw boost::system::system_error 地址不合法或者端口被占用
     */
    http_server(const configuration &config, const run_service &service);

    /**
     * @brief 处理连接，直到收到 SIGINT、SIGTERM 或者调用了 shutdown()
     * 返回前关闭所有连接并等待正在处理的请求结束
     */
    void run();

    /**
     * @brief 请求 run() 停止，可以在任意线程调用
     */
    void shutdown();

    /**
     * @brief 实际监听的端口，配置的端口为 0 时由系统分配
     */
    unsigned short port() const;

    /**
     * @brief 请求体的最大字节数
     * 代码在 JSON 中转义后最多膨胀 6 倍，另外留出测试描述的空间
     */
    std::size_t body_limit() const;

private:
    void accept();

    void serve(boost::asio::ip::tcp::socket socket);

    void stop();

    const configuration &config;
    const run_service &service;

    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor acceptor;
    boost::asio::signal_set signals;

    std::mutex sessions_mutex;
    std::condition_variable sessions_cv;

    /**
     * @brief 正在服务的连接的 socket fd，关闭服务时用于中断阻塞的读操作
     */
    std::set<int> sessions;

    /**
     * @brief stop() 之后不再接受新连接，只在 io_context 线程上访问
     */
    bool stopping;
};

}  // namespace runner::server

#include "server/http_server.hpp"
#include <sys/socket.h>
#include <glog/logging.h>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "server/router.hpp"

namespace runner::server {
using namespace std;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

http_server::http_server(const configuration &config, const run_service &service)
    : config(config), service(service), ioc(1), acceptor(ioc), signals(ioc, SIGINT, SIGTERM), stopping(false) {
    tcp::endpoint endpoint(asio::ip::make_address(config.host), config.port);
    acceptor.open(endpoint.protocol());
    acceptor.set_option(asio::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(asio::socket_base::max_listen_connections);
}

unsigned short http_server::port() const {
    return acceptor.local_endpoint().port();
}

size_t http_server::body_limit() const {
    return config.limits.max_source_bytes * 6 + (64 << 10);
}

void http_server::run() {
    LOG(INFO) << "Listening on " << config.host << ":" << port();

    signals.async_wait([this](const boost::system::error_code &ec, int signo) {
        if (ec) return;
        LOG(INFO) << "Received signal " << signo << ", shutting down";
        stop();
    });

    accept();
    ioc.run();

    unique_lock<mutex> lock(sessions_mutex);
    sessions_cv.wait(lock, [this] { return sessions.empty(); });
    LOG(INFO) << "Server stopped";
}

void http_server::accept() {
    acceptor.async_accept([this](const boost::system::error_code &ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted || stopping) return;
        if (ec) {
            LOG(WARNING) << "Unable to accept connection: " << ec.message();
        } else {
            // 必须在启动线程之前登记，否则 run() 可能在连接登记之前就认为所有连接都已结束
            int fd = socket.native_handle();
            {
                lock_guard<mutex> lock(sessions_mutex);
                sessions.insert(fd);
            }
            try {
                thread(&http_server::serve, this, move(socket)).detach();
            } catch (std::system_error &ex) {
                LOG(ERROR) << "Unable to start connection thread: " << ex.what();
                lock_guard<mutex> lock(sessions_mutex);
                sessions.erase(fd);
            }
        }
        accept();
    });
}

void http_server::shutdown() {
    asio::post(ioc, [this] { stop(); });
}

void http_server::stop() {
    stopping = true;
    boost::system::error_code ec;
    acceptor.close(ec);
    signals.cancel(ec);

    lock_guard<mutex> lock(sessions_mutex);
    for (int fd : sessions)
        ::shutdown(fd, SHUT_RDWR);
}

void http_server::serve(tcp::socket socket) {
    int fd = socket.native_handle();
    beast::error_code ec;
    defer {
        // 先关闭 socket：通知之后 run() 可能立即返回，io_context 随之销毁
        // 在锁内关闭，stop() 不会对已经被复用的 fd 调用 shutdown
        lock_guard<mutex> lock(sessions_mutex);
        socket.shutdown(tcp::socket::shutdown_send, ec);
        socket.close(ec);
        sessions.erase(fd);
        sessions_cv.notify_all();
    };


    beast::flat_buffer buffer;
    try {
        while (true) {
            http::request_parser<http::string_body> parser;
            parser.body_limit(body_limit());
            http::read(socket, buffer, parser, ec);
            if (ec == http::error::end_of_stream) break;
            if (ec == http::error::body_limit) {
                auto res = make_error_response(http::status::bad_request, "Request body too large", parser.get().version(), false);
                http::write(socket, res, ec);
                break;
            }
            if (ec) {
                if (ec != asio::error::connection_reset && ec != asio::error::eof)
                    LOG(WARNING) << "Unable to read request: " << ec.message();
                break;
            }

            http_response res = handle_request(parser.get(), service);
            bool keep_alive = res.keep_alive();
            http::write(socket, res, ec);
            if (ec) {
                LOG(WARNING) << "Unable to write response: " << ec.message();
                break;
            }
            if (!keep_alive) break;
        }
    } catch (std::exception &ex) {
        LOG(ERROR) << "Connection failed: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
    }
}

}  // namespace runner::server

#pragma once

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include "server/run_service.hpp"

namespace runner::server {

typedef boost::beast::http::request<boost::beast::http::string_body> http_request;
typedef boost::beast::http::response<boost::beast::http::string_body> http_response;

/**
 * @brief 构造 application/json 响应
 */
http_response make_json_response(boost::beast::http::status status, const nlohmann::json &body, unsigned version, bool keep_alive);

/**
 * @brief 构造 {"success": false, "error": message} 响应
 */
http_response make_error_response(boost::beast::http::status status, const std::string &message, unsigned version, bool keep_alive);

/**
 * @brief 处理一个 HTTP 请求
 * 不涉及 socket，可以直接在单元测试中调用
 *
 * GET /health -> 200 服务状态
 * POST /run -> 200 运行结果；请求不合法时 400；服务内部错误时 500
 * 其他路径 -> 404；路径正确但方法不对 -> 405
 */
http_response handle_request(const http_request &req, const run_service &service);

}  // namespace runner::server

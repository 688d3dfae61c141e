#include "server/router.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "server/json.hpp"

namespace runner::server {
using namespace std;
using json = nlohmann::json;
namespace http = boost::beast::http;

const char SERVICE_NAME[] = "code-runner";
const char SERVICE_VERSION[] = "1.0.0";

http_response make_json_response(http::status status, const json &body, unsigned version, bool keep_alive) {
    http_response res(status, version);
    res.set(http::field::server, SERVICE_NAME);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(keep_alive);
    res.body() = dump_json(body);
    res.prepare_payload();
    return res;
}

http_response make_error_response(http::status status, const string &message, unsigned version, bool keep_alive) {
    return make_json_response(status, {{"success", false}, {"error", message}}, version, keep_alive);
}

static http_response health(const http_request &req) {
    return make_json_response(http::status::ok,
                              {{"status", "healthy"}, {"service", SERVICE_NAME}, {"version", SERVICE_VERSION}},
                              req.version(), req.keep_alive());
}

static http_response run_code(const http_request &req, const run_service &service) {
    try {
        run_request request = parse_run_request(req.body());
        run_result result = service.run(request);
        return make_json_response(http::status::ok, result, req.version(), req.keep_alive());
    } catch (source_too_large &ex) {
        LOG(INFO) << "Rejected code of " << ex.size << " bytes, limit is " << ex.limit << " bytes";
        return make_error_response(http::status::bad_request, ex.what(), req.version(), req.keep_alive());
    } catch (bad_request &ex) {
        return make_error_response(http::status::bad_request, ex.what(), req.version(), req.keep_alive());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to handle /run request: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        return make_error_response(http::status::internal_server_error, "Internal server error", req.version(), req.keep_alive());
    }
}

static http_response method_not_allowed(const http_request &req, http::verb allowed) {
    http_response res = make_error_response(http::status::method_not_allowed, "Method not allowed", req.version(), req.keep_alive());
    res.set(http::field::allow, http::to_string(allowed));
    return res;
}

http_response handle_request(const http_request &req, const run_service &service) {
    // 忽略查询字符串
    auto target = req.target();
    auto path = target.substr(0, target.find('?'));

    if (path == "/health") {
        if (req.method() != http::verb::get) return method_not_allowed(req, http::verb::get);
        return health(req);
    } else if (path == "/run") {
        if (req.method() != http::verb::post) return method_not_allowed(req, http::verb::post);
        return run_code(req, service);
    } else {
        return make_error_response(http::status::not_found, "Not found", req.version(), req.keep_alive());
    }
}

}  // namespace runner::server

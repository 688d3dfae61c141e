#include "server/json.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace runner {
using namespace std;
using json = nlohmann::json;

void from_json(const json &j, test_spec &spec) {
    if (!j.is_object()) throw bad_request("Invalid tests");

    // 非字符串的类型原样回显在 "Unknown test type" 中
    if (j.count("type") && !j.at("type").is_null())
        spec.type = j.at("type").is_string() ? j.at("type").get<string>() : j.at("type").dump();
    spec.description = nlohmann::get_optional<string>(j, "description");
    spec.variable = nlohmann::get_optional<string>(j, "variable");
    if (j.count("expected"))
        spec.expected = j.at("expected");
    spec.expected_type = nlohmann::get_optional<string>(j, "expectedType");
}

void to_json(json &j, const test_verdict &verdict) {
    j = {{"description", verdict.description ? json(*verdict.description) : json()},
         {"passed", verdict.passed}};
    if (verdict.expected) j["expected"] = *verdict.expected;
    if (verdict.actual) j["actual"] = *verdict.actual;
    if (verdict.error) j["error"] = *verdict.error;
}

void to_json(json &j, const run_result &result) {
    j = {{"success", result.success},
         {"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"testResults", result.test_results},
         {"executionTimeMs", result.execution_time_ms},
         {"allPassed", result.all_passed}};
}

}  // namespace runner

namespace runner::server {
using namespace std;
using json = nlohmann::json;

// 期望值会被递归地转换成文本，嵌套层数过多时会耗尽栈空间
const int MAX_JSON_DEPTH = 64;

run_request parse_run_request(const string &body) {
    bool too_deep = false;
    json::parser_callback_t limit_depth = [&](int depth, json::parse_event_t event, json &) {
        if ((event == json::parse_event_t::object_start || event == json::parse_event_t::array_start) &&
            depth >= MAX_JSON_DEPTH)
            too_deep = true;
        return !too_deep;
    };
    json j = json::parse(body, limit_depth, false);
    if (too_deep || j.is_discarded() || !j.is_object()) throw bad_request("Invalid JSON");

    run_request request;
    auto code = nlohmann::get_optional<string>(j, "code");
    if (!code || code->empty()) throw bad_request("No code provided");
    request.code = move(*code);

    if (nlohmann::exists(j, "tests")) {
        const json &tests = j.at("tests");
        if (!tests.is_array()) throw bad_request("Invalid tests");
        for (auto &test : tests)
            request.tests.push_back(test.get<test_spec>());
    }
    return request;
}

string dump_json(const json &j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace runner::server

#include "judge/evaluator.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <map>
#include <stdexcept>
#include "judge/inspection.hpp"

namespace runner {
using namespace std;
using json = nlohmann::json;

optional<test_kind> parse_test_kind(const string &type) {
    static const map<string, test_kind> kinds = {
        {"output", test_kind::output},
        {"variable_exists", test_kind::variable_exists},
        {"variable_type", test_kind::variable_type},
        {"variable_value", test_kind::variable_value},
        {"function_call", test_kind::function_call},
        {"list_contains", test_kind::list_contains},
        {"list_length", test_kind::list_length}};
    auto it = kinds.find(type);
    if (it == kinds.end()) return nullopt;
    return it->second;
}

static test_verdict make_verdict(const test_spec &spec, bool passed, json expected, json actual) {
    test_verdict verdict;
    verdict.description = spec.description;
    verdict.passed = passed;
    verdict.expected = move(expected);
    verdict.actual = move(actual);
    return verdict;
}

static test_verdict failed_verdict(const test_spec &spec, const string &error) {
    test_verdict verdict;
    verdict.description = spec.description;
    verdict.passed = false;
    verdict.error = error;
    return verdict;
}

static bool has_variable(const test_spec &spec) {
    return spec.variable && !spec.variable->empty();
}

/**
 * @brief 期望值的字符串形式，缺少 expected 字段时为空字符串
 */
static string expected_text(const test_spec &spec) {
    return spec.expected ? python_str(*spec.expected) : "";
}

static test_verdict check_output(const test_spec &spec, const evaluation_context &ctx) {
    string expected = boost::algorithm::trim_copy(expected_text(spec));
    string actual = boost::algorithm::trim_copy(ctx.outcome.stdout_text);
    return make_verdict(spec, actual == expected, expected, actual);
}

static test_verdict check_variable_exists(const test_spec &spec, const evaluation_context &ctx) {
    if (!has_variable(spec)) return failed_verdict(spec, "Missing field: variable");
    bool exists = has_assignment(ctx.source, *spec.variable);
    return make_verdict(spec, exists,
                        fmt::format("Variable '{}' should exist", *spec.variable),
                        exists ? "Found" : "Not found");
}

static test_verdict check_variable_type(const test_spec &spec, const evaluation_context &ctx) {
    if (!has_variable(spec)) return failed_verdict(spec, "Missing field: variable");
    json expected = spec.expected_type ? json(*spec.expected_type) : json();
    auto literal = find_first_assignment(ctx.source, *spec.variable);
    if (!literal) return make_verdict(spec, false, expected, "Variable not found");

    string inferred = infer_literal_type(*literal);
    bool passed = spec.expected_type && type_name_matches(inferred, *spec.expected_type);
    return make_verdict(spec, passed, expected, inferred);
}

static test_verdict check_variable_value(const test_spec &spec, const evaluation_context &ctx) {
    if (!has_variable(spec)) return failed_verdict(spec, "Missing field: variable");
    json expected = spec.expected.value_or(json());
    auto literal = find_first_assignment(ctx.source, *spec.variable);
    if (!literal) return make_verdict(spec, false, expected, "Variable not found");

    // 接受裸写、双引号、单引号三种写法
    string text = python_str(expected);
    bool passed = *literal == text || *literal == "\"" + text + "\"" || *literal == "'" + text + "'";
    return make_verdict(spec, passed, expected, *literal);
}

static test_verdict check_function_call(const test_spec &spec, const evaluation_context &ctx) {
    string expected = boost::algorithm::trim_copy(expected_text(spec));
    vector<string> lines;
    boost::split(lines, ctx.outcome.stdout_text, boost::is_any_of("\n"));
    bool passed = false;
    for (auto &line : lines) {
        if (boost::algorithm::trim_copy(line) == expected) {
            passed = true;
            break;
        }
    }
    return make_verdict(spec, passed, expected, ctx.outcome.stdout_text);
}

static test_verdict check_list_contains(const test_spec &spec, const evaluation_context &ctx) {
    if (!has_variable(spec)) return failed_verdict(spec, "Missing field: variable");
    json expected = spec.expected.value_or(json());
    auto contents = find_list_literal(ctx.source, *spec.variable);
    if (!contents) return make_verdict(spec, false, expected, "List not found");

    string text = python_str(expected);
    bool passed = contents->find(json_token(expected)) != string::npos ||
                  contents->find("'" + text + "'") != string::npos ||
                  contents->find("\"" + text + "\"") != string::npos;
    return make_verdict(spec, passed, "List should contain " + text, *contents);
}

static test_verdict check_list_length(const test_spec &spec, const evaluation_context &ctx) {
    if (!has_variable(spec)) return failed_verdict(spec, "Missing field: variable");
    json expected = spec.expected.value_or(json());
    auto contents = find_list_literal(ctx.source, *spec.variable);
    if (!contents) return make_verdict(spec, false, expected, "List not found");

    size_t count = count_list_items(*contents);
    bool passed = false;
    if (expected.is_number_unsigned())
        passed = expected.get<uint64_t>() == count;
    else if (expected.is_number_integer())
        passed = expected.get<int64_t>() == (int64_t)count;
    else if (expected.is_number_float())
        passed = expected.get<double>() == (double)count;
    return make_verdict(spec, passed, expected, count);
}

evaluation_strategy strategy_for(test_kind kind) {
    switch (kind) {
        case test_kind::output: return check_output;
        case test_kind::variable_exists: return check_variable_exists;
        case test_kind::variable_type: return check_variable_type;
        case test_kind::variable_value: return check_variable_value;
        case test_kind::function_call: return check_function_call;
        case test_kind::list_contains: return check_list_contains;
        case test_kind::list_length: return check_list_length;
    }
    throw invalid_argument(fmt::format("Unhandled test kind {}", (int)kind));
}

test_verdict evaluate_test(const evaluation_context &ctx, const test_spec &spec) {
    string stderr_text = ctx.outcome.effective_stderr();
    if (!stderr_text.empty() && ctx.outcome.stdout_text.empty()) {
        test_verdict verdict;
        verdict.description = spec.description.value_or("Test");
        verdict.passed = false;
        verdict.error = stderr_text;
        verdict.actual = "Execution error";
        return verdict;
    }

    optional<test_kind> kind = spec.type ? parse_test_kind(*spec.type) : nullopt;
    if (!kind)
        return failed_verdict(spec, fmt::format("Unknown test type: {}", spec.type.value_or("None")));
    return strategy_for(*kind)(spec, ctx);
}

vector<test_verdict> evaluate(const string &source, const execution_outcome &outcome, const vector<test_spec> &specs) {
    evaluation_context ctx{source, outcome};
    vector<test_verdict> verdicts;
    verdicts.reserve(specs.size());
    for (auto &spec : specs)
        verdicts.push_back(evaluate_test(ctx, spec));
    return verdicts;
}

}  // namespace runner

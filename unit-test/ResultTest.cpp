#include "gtest/gtest.h"
#include "judge/result.hpp"
#include "server/json.hpp"
#include "test/assertions.hpp"
#include "test/mock_backend.hpp"

using namespace std;
using namespace runner;
using namespace runner::test;
using json = nlohmann::json;

static test_verdict make_verdict(bool passed) {
    test_verdict verdict;
    verdict.description = passed ? "passing" : "failing";
    verdict.passed = passed;
    return verdict;
}

TEST(ResultTest, EmptyTestsPassTest) {
    auto result = aggregate(make_outcome("", "Traceback (most recent call last)"), {}, 12);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.all_passed);
    EXPECT_TRUE(result.test_results.empty());
    EXPECT_EQ(result.stderr_text, "Traceback (most recent call last)");
    EXPECT_EQ(result.execution_time_ms, 12);
}

TEST(ResultTest, AllPassedTest) {
    auto result = aggregate(make_outcome("ok"), {make_verdict(true), make_verdict(true)}, 5);
    EXPECT_TRUE(result.all_passed);
    EXPECT_EQ(result.stdout_text, "ok");
    EXPECT_EQ(result.test_results.size(), 2u);
}

TEST(ResultTest, AnyFailureTest) {
    auto result = aggregate(make_outcome("ok"), {make_verdict(true), make_verdict(false), make_verdict(true)}, 5);
    EXPECT_FALSE(result.all_passed);
    EXPECT_TRUE(result.success);
    ASSERT_EQ(result.test_results.size(), 3u);
    EXPECT_EQ(result.test_results[1].description, "failing");
}

TEST(ResultTest, LaunchErrorTest) {
    execution_outcome outcome;
    outcome.launch_error = "Interpreter python3 not found";
    auto result = aggregate(outcome, {}, 0);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, "");
    EXPECT_EQ(result.stderr_text, "Execution error: Interpreter python3 not found");
}

TEST(ResultTest, SerializeTest) {
    test_verdict with_fields;
    with_fields.description = "prints hello";
    with_fields.passed = true;
    with_fields.expected = "hello";
    with_fields.actual = "hello";

    test_verdict with_error;
    with_error.passed = false;
    with_error.error = "Unknown test type: foo";

    auto result = aggregate(make_outcome("hello"), {with_fields, with_error}, 40);
    json j = result;
    EXPECT_JSON_EQ(j, json::parse(R"({
        "success": true,
        "stdout": "hello",
        "stderr": "",
        "executionTimeMs": 40,
        "allPassed": false,
        "testResults": [
            {"description": "prints hello", "passed": true, "expected": "hello", "actual": "hello"},
            {"description": null, "passed": false, "error": "Unknown test type: foo"}
        ]
    })"));
}

TEST(ResultTest, ParseTestSpecTest) {
    auto spec = json::parse(R"({"type": "variable_type", "description": "d", "variable": "x", "expectedType": "float", "expected": [1, 2]})").get<test_spec>();
    EXPECT_EQ(spec.type, "variable_type");
    EXPECT_EQ(spec.description, "d");
    EXPECT_EQ(spec.variable, "x");
    EXPECT_EQ(spec.expected_type, "float");
    ASSERT_TRUE(spec.expected);
    EXPECT_JSON_EQ(*spec.expected, json::array({1, 2}));

    spec = json::parse(R"({"type": 5, "variable": 3, "expected": null})").get<test_spec>();
    EXPECT_EQ(spec.type, "5");
    EXPECT_FALSE(spec.variable);
    ASSERT_TRUE(spec.expected);
    EXPECT_TRUE(spec.expected->is_null());

    spec = json::parse(R"({})").get<test_spec>();
    EXPECT_FALSE(spec.type);
    EXPECT_FALSE(spec.expected);
}

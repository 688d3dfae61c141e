#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "server/run_service.hpp"
#include "test/mock_backend.hpp"

using namespace std;
using namespace runner;
using namespace runner::server;
using namespace runner::test;
using ::testing::_;
using ::testing::ByMove;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

class RunServiceTest : public ::testing::Test {
protected:
    RunServiceTest() : service(config, backend) {}

    static run_request make_request(const string &code) {
        run_request request;
        request.code = code;
        test_spec spec;
        spec.type = "output";
        spec.expected = "42";
        request.tests.push_back(spec);
        return request;
    }

    configuration config;
    StrictMock<mock_backend> backend;
    run_service service;
};

TEST_F(RunServiceTest, SuccessfulRunTest) {
    InSequence seq;
    EXPECT_CALL(backend, launch("print(42)")).WillOnce(Return(ByMove(make_unit())));
    EXPECT_CALL(backend, wait(_, _)).WillOnce(Return(make_outcome("42")));
    EXPECT_CALL(backend, cleanup(_)).Times(1);

    auto result = service.run(make_request("print(42)"));
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.all_passed);
    EXPECT_EQ(result.stdout_text, "42");
    ASSERT_EQ(result.test_results.size(), 1u);
    EXPECT_TRUE(result.test_results[0].passed);
}

TEST_F(RunServiceTest, DeadlineFollowsWallLimitTest) {
    config.limits.max_wall_time_ms = 1500;
    auto before = chrono::steady_clock::now();
    EXPECT_CALL(backend, launch(_)).WillOnce(Return(ByMove(make_unit())));
    EXPECT_CALL(backend, wait(_, _)).WillOnce(Invoke([before](execution_unit &, chrono::steady_clock::time_point deadline) {
        EXPECT_GE(deadline, before + chrono::milliseconds(1500));
        EXPECT_LE(deadline, chrono::steady_clock::now() + chrono::milliseconds(1500));
        return make_outcome("42");
    }));
    EXPECT_CALL(backend, cleanup(_)).Times(1);

    service.run(make_request("print(42)"));
}

TEST_F(RunServiceTest, CleanupWhenWaitThrowsTest) {
    InSequence seq;
    EXPECT_CALL(backend, launch(_)).WillOnce(Return(ByMove(make_unit())));
    EXPECT_CALL(backend, wait(_, _)).WillOnce(Throw(system_error(EIO, system_category(), "reading output of child process")));
    EXPECT_CALL(backend, kill(_)).Times(1);
    EXPECT_CALL(backend, cleanup(_)).Times(1);

    auto result = service.run(make_request("print(42)"));
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.all_passed);
    EXPECT_EQ(result.stdout_text, "");
    EXPECT_EQ(result.stderr_text.rfind("Execution error: ", 0), 0u);
}

TEST_F(RunServiceTest, CleanupWhenKillThrowsTest) {
    EXPECT_CALL(backend, launch(_)).WillOnce(Return(ByMove(make_unit())));
    EXPECT_CALL(backend, wait(_, _)).WillOnce(Throw(internal_error("wait failed")));
    EXPECT_CALL(backend, kill(_)).WillOnce(Throw(internal_error("kill failed")));
    EXPECT_CALL(backend, cleanup(_)).Times(1);

    auto result = service.run(make_request("print(42)"));
    EXPECT_EQ(result.stderr_text, "Execution error: wait failed");
}

TEST_F(RunServiceTest, LaunchErrorTest) {
    EXPECT_CALL(backend, launch(_)).WillOnce(Throw(launch_error("Interpreter python3 not found")));

    auto result = service.run(make_request("print(42)"));
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.all_passed);
    EXPECT_EQ(result.stderr_text, "Execution error: Interpreter python3 not found");
    ASSERT_EQ(result.test_results.size(), 1u);
    EXPECT_EQ(result.test_results[0].error, "Execution error: Interpreter python3 not found");
}

TEST_F(RunServiceTest, TimeoutTest) {
    execution_outcome timed_out;
    timed_out.timed_out = true;
    timed_out.stderr_text = "Error: Execution timeout (2 seconds exceeded)";
    EXPECT_CALL(backend, launch(_)).WillOnce(Return(ByMove(make_unit())));
    EXPECT_CALL(backend, wait(_, _)).WillOnce(Return(timed_out));
    EXPECT_CALL(backend, cleanup(_)).Times(1);

    auto result = service.run(make_request("while True: pass"));
    EXPECT_FALSE(result.all_passed);
    EXPECT_EQ(result.stdout_text, "");
    EXPECT_EQ(result.stderr_text, "Error: Execution timeout (2 seconds exceeded)");
}

TEST_F(RunServiceTest, SourceTooLargeTest) {
    config.limits.max_source_bytes = 8;
    // 超长的代码不能创建任何执行单元
    EXPECT_CALL(backend, launch(_)).Times(0);

    EXPECT_THROW(service.run(make_request("print('too long')")), source_too_large);
}

#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "sandbox/limits.hpp"
#include "sandbox/outcome.hpp"

using namespace std;
using namespace runner;

TEST(LimitsTest, DefaultsTest) {
    resource_limits limits;
    EXPECT_EQ(limits.max_wall_time_ms, 2000);
    EXPECT_EQ(limits.max_output_bytes, 1048576u);
    EXPECT_EQ(limits.max_source_bytes, 102400u);
}

TEST(LimitsTest, SourceAtLimitTest) {
    resource_limits limits;
    EXPECT_NO_THROW(check_source_size(string(limits.max_source_bytes, 'a'), limits));
    EXPECT_NO_THROW(check_source_size("", limits));
}

TEST(LimitsTest, SourceOverLimitTest) {
    resource_limits limits;
    try {
        check_source_size(string(limits.max_source_bytes + 1, 'a'), limits);
        FAIL() << "source_too_large expected";
    } catch (source_too_large &ex) {
        EXPECT_EQ(ex.size, limits.max_source_bytes + 1);
        EXPECT_EQ(ex.limit, limits.max_source_bytes);
        EXPECT_STREQ(ex.what(), "Code exceeds maximum size (102400 bytes)");
    }
}

TEST(LimitsTest, SourceSizeCountsBytesTest) {
    resource_limits limits;
    limits.max_source_bytes = 4;
    // 两个汉字占 6 个字节
    EXPECT_THROW(check_source_size("\xe4\xbd\xa0\xe5\xa5\xbd", limits), source_too_large);
}

TEST(LimitsTest, WallLimitFormatTest) {
    resource_limits limits;
    EXPECT_EQ(format_wall_limit(limits), "2");
    limits.max_wall_time_ms = 1500;
    EXPECT_EQ(format_wall_limit(limits), "1.5");
    EXPECT_EQ(timeout_message(format_wall_limit(limits)), "Error: Execution timeout (1.5 seconds exceeded)");
}

TEST(LimitsTest, CpuLimitRoundsUpTest) {
    resource_limits limits;
    EXPECT_EQ(cpu_limit_seconds(limits), 3);
    limits.max_wall_time_ms = 2001;
    EXPECT_EQ(cpu_limit_seconds(limits), 4);
    limits.max_wall_time_ms = 1;
    EXPECT_EQ(cpu_limit_seconds(limits), 2);
}

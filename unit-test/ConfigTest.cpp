#include <boost/program_options.hpp>
#include <cstdlib>
#include "config.hpp"
#include "gtest/gtest.h"
#include "common/utils.hpp"

using namespace std;
using namespace runner;
namespace po = boost::program_options;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char *env : {"HOST", "PORT", "MAX_WALL_TIME_MS", "MAX_OUTPUT_BYTES", "MAX_SOURCE_BYTES",
                                "MAX_MEMORY_BYTES", "MAX_PROCESSES", "PYTHON", "SCRATCHDIR", "RUNUSER", "STRICT_ISOLATION"})
            unsetenv(env);
    }

    void TearDown() override {
        SetUp();
    }

    static optional<configuration> parse(vector<const char *> args) {
        args.insert(args.begin(), "code-runner");
        return parse_configuration((int)args.size(), args.data());
    }
};

TEST_F(ConfigTest, DefaultsTest) {
    auto config = parse({});
    ASSERT_TRUE(config);
    EXPECT_EQ(config->host, "0.0.0.0");
    EXPECT_EQ(config->port, 8080);
    EXPECT_EQ(config->limits.max_wall_time_ms, 2000);
    EXPECT_EQ(config->limits.max_output_bytes, 1048576u);
    EXPECT_EQ(config->limits.max_source_bytes, 102400u);
    EXPECT_EQ(config->sandbox.interpreter, "python3");
    EXPECT_EQ(config->sandbox.scratch_dir, filesystem::temp_directory_path());
    EXPECT_FALSE(config->sandbox.run_user);
    EXPECT_TRUE(config->sandbox.isolate_network);
    EXPECT_FALSE(config->sandbox.strict_isolation);
}

TEST_F(ConfigTest, CommandLineTest) {
    auto config = parse({"--host", "127.0.0.1", "--port", "9090", "--max-wall-time-ms", "500",
                         "--max-output-bytes", "2048", "--interpreter", "/usr/bin/python3",
                         "--run-user", "nobody", "--no-isolate-network", "--strict-isolation"});
    ASSERT_TRUE(config);
    EXPECT_EQ(config->host, "127.0.0.1");
    EXPECT_EQ(config->port, 9090);
    EXPECT_EQ(config->limits.max_wall_time_ms, 500);
    EXPECT_EQ(config->limits.max_output_bytes, 2048u);
    EXPECT_EQ(config->sandbox.interpreter, "/usr/bin/python3");
    EXPECT_EQ(config->sandbox.run_user, "nobody");
    EXPECT_FALSE(config->sandbox.isolate_network);
    EXPECT_TRUE(config->sandbox.strict_isolation);
}

TEST_F(ConfigTest, EnvironmentFallbackTest) {
    set_env("PORT", "9000");
    set_env("MAX_SOURCE_BYTES", "1024");
    set_env("SCRATCHDIR", "/var/tmp");
    set_env("STRICT_ISOLATION", "true");

    auto config = parse({});
    ASSERT_TRUE(config);
    EXPECT_EQ(config->port, 9000);
    EXPECT_EQ(config->limits.max_source_bytes, 1024u);
    EXPECT_EQ(config->sandbox.scratch_dir, filesystem::path("/var/tmp"));
    EXPECT_TRUE(config->sandbox.strict_isolation);

    // 命令行参数优先于环境变量
    config = parse({"--port", "9001"});
    ASSERT_TRUE(config);
    EXPECT_EQ(config->port, 9001);
}

TEST_F(ConfigTest, InvalidValueTest) {
    EXPECT_THROW(parse({"--port", "http"}), po::error);
    EXPECT_THROW(parse({"--port", "70000"}), po::error);
    EXPECT_THROW(parse({"--max-wall-time-ms", "0"}), po::error);
    EXPECT_THROW(parse({"--unknown-flag"}), po::error);
    EXPECT_THROW(parse({"--isolate-network", "--no-isolate-network"}), po::error);

    set_env("MAX_WALL_TIME_MS", "soon");
    EXPECT_THROW(parse({}), po::error);
}

TEST_F(ConfigTest, HelpAndVersionTest) {
    EXPECT_FALSE(parse({"--help"}));
    EXPECT_FALSE(parse({"--version"}));
}

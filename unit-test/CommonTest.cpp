#include <fcntl.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runner;
namespace fs = std::filesystem;

TEST(CommonTest, DeferTest) {
    int counter = 0;
    {
        defer { ++counter; };
        EXPECT_EQ(counter, 0);
    }
    EXPECT_EQ(counter, 1);

    try {
        defer { ++counter; };
        throw runtime_error("leaving scope");
    } catch (runtime_error &) {
    }
    EXPECT_EQ(counter, 2);
}

TEST(CommonTest, ScopedScratchDirTest) {
    fs::path root = fs::temp_directory_path() / "code-runner-test" / "common";
    fs::remove_all(root);
    fs::create_directories(root);

    fs::path dir;
    {
        scoped_scratch_dir scratch(root, "run");
        dir = scratch.path();
        EXPECT_TRUE(fs::is_directory(dir));
        EXPECT_EQ(dir.filename().string().rfind("run-", 0), 0u);
        EXPECT_EQ(fs::status(dir).permissions() & fs::perms::all, fs::perms::owner_all);
        write_file_content(dir / "main.py", "print(1)\n");
        ifstream fin(dir / "main.py");
        string content((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
        EXPECT_EQ(content, "print(1)\n");

        scoped_scratch_dir other(root, "run");
        EXPECT_NE(other.path(), dir);
        EXPECT_EQ(count_directories_in_directory(root), 2);
    }
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_EQ(count_directories_in_directory(root), 0);
}

TEST(CommonTest, ScopedScratchDirMoveTest) {
    fs::path root = fs::temp_directory_path() / "code-runner-test" / "common-move";
    fs::remove_all(root);
    fs::create_directories(root);

    scoped_scratch_dir target;
    {
        scoped_scratch_dir scratch(root, "run");
        target = move(scratch);
    }
    EXPECT_EQ(count_directories_in_directory(root), 1);
    target.release();
    target.release();
    EXPECT_EQ(count_directories_in_directory(root), 0);
}

TEST(CommonTest, ScopedFdTest) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    {
        scoped_fd read_end(fds[0]);
        scoped_fd write_end(fds[1]);
        EXPECT_TRUE(read_end.valid());
        scoped_fd moved(move(write_end));
        EXPECT_FALSE(write_end.valid());
        EXPECT_EQ(moved.get(), fds[1]);
    }
    EXPECT_EQ(fcntl(fds[0], F_GETFD), -1);
    EXPECT_EQ(fcntl(fds[1], F_GETFD), -1);
}

TEST(CommonTest, WhichTest) {
    EXPECT_FALSE(which("sh").empty());
    EXPECT_TRUE(which("definitely-not-a-command-1234").empty());
    EXPECT_EQ(which("/bin/sh"), fs::path("/bin/sh"));
    EXPECT_TRUE(which("/nonexistent/python").empty());
    EXPECT_TRUE(which("").empty());
}

TEST(CommonTest, EnvTest) {
    set_env("CODE_RUNNER_TEST_VALUE", "42");
    EXPECT_EQ(get_env("CODE_RUNNER_TEST_VALUE", ""), "42");
    EXPECT_EQ(get_env_as<int>("CODE_RUNNER_TEST_VALUE", 0), 42);
    unsetenv("CODE_RUNNER_TEST_VALUE");
    EXPECT_EQ(get_env_as<int>("CODE_RUNNER_TEST_VALUE", 7), 7);
}

TEST(CommonTest, ExceptionMessageTest) {
    source_too_large ex(200, 100);
    EXPECT_STREQ(ex.what(), "Code exceeds maximum size (100 bytes)");
    launch_error launch("Interpreter python3 not found");
    EXPECT_STREQ(launch.what(), "Interpreter python3 not found");
    stringstream ss;
    ss << launch;
    EXPECT_NE(ss.str().find("Interpreter python3 not found"), string::npos);
}

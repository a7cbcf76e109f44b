/**
 * proxy_process_test.cpp - ProxyProcess unit tests
 *
 * Tests:
 * - Spawn with missing executable (error path)
 * - Exit code and output capture for a short-lived script
 * - Bounded output tails, including overlong lines
 * - Working directory
 * - SIGTERM termination of a long-running child
 *
 * Helper executables are bash scripts written into a per-test temp dir.
 */

#include "proxy/proxy_process.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace proxyvisor::proxy;

class ProxyProcessTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir = fs::temp_directory_path() / ("proxyvisor_process_test_" + std::string(info->name()));
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
    }

    void TearDown() override { fs::remove_all(temp_dir); }

    std::string write_script(const std::string &name, const std::string &body) {
        fs::path path = temp_dir / name;
        {
            std::ofstream script(path);
            script << "#!/bin/bash\n" << body << "\n";
        }
        chmod(path.c_str(), 0755);
        return path.string();
    }
};

TEST_F(ProxyProcessTest, SpawnMissingExecutableFails) {
    ProxyProcess process("test", (temp_dir / "does_not_exist").string());

    EXPECT_FALSE(process.spawn());
    EXPECT_NE(process.last_error().find("Executable not found"), std::string::npos);
    EXPECT_FALSE(process.is_running());
    EXPECT_FALSE(process.exit_code().has_value());
}

TEST_F(ProxyProcessTest, CapturesExitCodeAndOutput) {
    auto script = write_script("exit3.sh", "echo out-line\necho err-line >&2\nexit 3");
    ProxyProcess process("test", script);

    ASSERT_TRUE(process.spawn()) << process.last_error();
    EXPECT_GT(process.pid(), 0);
    ASSERT_TRUE(process.wait_for_exit(5000));

    ASSERT_TRUE(process.exit_code().has_value());
    EXPECT_EQ(*process.exit_code(), 3);
    EXPECT_FALSE(process.is_running());
    EXPECT_EQ(process.stdout_tail(), "out-line");
    EXPECT_EQ(process.stderr_tail(), "err-line");
}

TEST_F(ProxyProcessTest, PassesArguments) {
    auto script = write_script("args.sh", "echo \"$1|$2\"");
    ProxyProcess process("test", script, {"-config", "/tmp/config.yaml"});

    ASSERT_TRUE(process.spawn());
    ASSERT_TRUE(process.wait_for_exit(5000));
    EXPECT_EQ(process.stdout_tail(), "-config|/tmp/config.yaml");
}

TEST_F(ProxyProcessTest, OutputTailIsBounded) {
    auto script = write_script("chatty.sh", "for i in $(seq 1 20); do echo line$i; done");
    ProxyProcess process("test", script, {}, "", 3);

    ASSERT_TRUE(process.spawn());
    ASSERT_TRUE(process.wait_for_exit(5000));
    EXPECT_EQ(process.stdout_tail(), "line18\nline19\nline20");
}

TEST_F(ProxyProcessTest, PartialTrailingLineIncluded) {
    auto script = write_script("partial.sh", "printf 'first\\nno-newline'");
    ProxyProcess process("test", script);

    ASSERT_TRUE(process.spawn());
    ASSERT_TRUE(process.wait_for_exit(5000));
    EXPECT_EQ(process.stdout_tail(), "first\nno-newline");
}

TEST_F(ProxyProcessTest, OverlongLinesKeepTheirEnd) {
    auto script = write_script("flood.sh",
                               "head -c 100000 /dev/zero | tr '\\0' 'x'; echo END\n"
                               "head -c 100000 /dev/zero | tr '\\0' 'y'; printf TAIL");
    ProxyProcess process("test", script);

    ASSERT_TRUE(process.spawn());
    ASSERT_TRUE(process.wait_for_exit(5000));

    const std::string tail = process.stdout_tail();
    const auto newline = tail.find('\n');
    ASSERT_NE(newline, std::string::npos);
    const std::string first = tail.substr(0, newline);
    const std::string second = tail.substr(newline + 1);
    EXPECT_LE(first.size(), 4096u);
    EXPECT_EQ(first.substr(first.size() - 4), "xEND");
    EXPECT_LE(second.size(), 4096u);
    EXPECT_EQ(second.substr(second.size() - 5), "yTAIL");
}

TEST_F(ProxyProcessTest, RunsInWorkingDirectory) {
    auto script = write_script("pwd.sh", "pwd -P");
    ProxyProcess process("test", script, {}, temp_dir.string());

    ASSERT_TRUE(process.spawn());
    ASSERT_TRUE(process.wait_for_exit(5000));
    EXPECT_EQ(process.stdout_tail(), fs::canonical(temp_dir).string());
}

TEST_F(ProxyProcessTest, TerminateStopsLongRunningChild) {
    auto script = write_script("sleeper.sh", "exec sleep 30");
    ProxyProcess process("test", script);

    ASSERT_TRUE(process.spawn());
    EXPECT_TRUE(process.is_running());

    EXPECT_TRUE(process.terminate(2000));
    EXPECT_FALSE(process.is_running());
    ASSERT_TRUE(process.exit_code().has_value());
    EXPECT_EQ(*process.exit_code(), 128 + 15);
}

TEST_F(ProxyProcessTest, TerminateEscalatesToKill) {
    auto script = write_script("stubborn.sh", "trap '' TERM\nwhile true; do sleep 0.1; done");
    ProxyProcess process("test", script);

    ASSERT_TRUE(process.spawn());
    // Give bash time to install the trap
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    EXPECT_TRUE(process.terminate(300));
    ASSERT_TRUE(process.exit_code().has_value());
    EXPECT_EQ(*process.exit_code(), 128 + 9);
}

TEST_F(ProxyProcessTest, SecondSpawnWhileRunningFails) {
    auto script = write_script("sleeper.sh", "exec sleep 30");
    ProxyProcess process("test", script);

    ASSERT_TRUE(process.spawn());
    EXPECT_FALSE(process.spawn());
    EXPECT_NE(process.last_error().find("already running"), std::string::npos);

    process.terminate(2000);
}

TEST_F(ProxyProcessTest, TerminateWithoutSpawnIsNoop) {
    ProxyProcess process("test", "/bin/true");

    EXPECT_TRUE(process.terminate(100));
    EXPECT_TRUE(process.wait_for_exit(10));
}

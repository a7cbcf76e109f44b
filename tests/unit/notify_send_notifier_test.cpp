/**
 * notify_send_notifier_test.cpp - NotifySendNotifier unit tests
 *
 * Tests:
 * - A command that cannot be executed reports failure
 * - A working command reports success and receives title and body
 *
 * Stand-in notifier commands are bash scripts written into a per-test temp dir.
 */

#include "notify/notify_send_notifier.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace proxyvisor::notify;
using namespace std::chrono_literals;

class NotifySendNotifierTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir = fs::temp_directory_path() / ("proxyvisor_notify_test_" + std::string(info->name()));
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
    }

    void TearDown() override { fs::remove_all(temp_dir); }

    std::string write_script(const std::string &name, const std::string &body, mode_t mode = 0755) {
        fs::path path = temp_dir / name;
        {
            std::ofstream script(path);
            script << "#!/bin/bash\n" << body << "\n";
        }
        chmod(path.c_str(), mode);
        return path.string();
    }

    static Notification sample() { return Notification{"codex:a@example.com", "Codex quota low", "5h window at 8%"}; }
};

TEST_F(NotifySendNotifierTest, MissingCommandReportsFailure) {
    NotifySendNotifier notifier("proxyvisor", (temp_dir / "no-such-notify-send").string());
    EXPECT_FALSE(notifier.notify(sample()));
}

TEST_F(NotifySendNotifierTest, NonExecutableCommandReportsFailure) {
    std::string script = write_script("notify-send", "exit 0", 0644);
    NotifySendNotifier notifier("proxyvisor", script);
    EXPECT_FALSE(notifier.notify(sample()));
}

TEST_F(NotifySendNotifierTest, WorkingCommandReceivesMessage) {
    fs::path out = temp_dir / "args.txt";
    std::string script = write_script("notify-send", "printf '%s\\n' \"$@\" > '" + out.string() + ".tmp' && mv '" +
                                                         out.string() + ".tmp' '" + out.string() + "'");
    NotifySendNotifier notifier("proxyvisor", script);
    ASSERT_TRUE(notifier.notify(sample()));

    // Delivery is detached, wait for the script to finish
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!fs::exists(out) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(fs::exists(out));

    std::ifstream in(out);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "--app-name=proxyvisor\nCodex quota low\n5h window at 8%\n");
}

/**
 * process_supervisor_test.cpp - ProcessSupervisor lifecycle tests
 *
 * The port inspector is mocked so tests control what "listening" means;
 * the proxy binary is a bash script so spawn, exit and SIGTERM are real.
 */

#include "proxy/process_supervisor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <signal.h>
#include <sys/stat.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <thread>

#include "mocks/mock_port_inspector.hpp"

namespace fs = std::filesystem;
using namespace proxyvisor;
using namespace proxyvisor::proxy;
using proxyvisor::tests::MockPortInspector;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

constexpr int kPort = 18317;

}  // namespace

class ProcessSupervisorTest : public ::testing::Test {
protected:
    fs::path temp_dir;
    std::string config_path;
    NiceMock<MockPortInspector> ports;
    std::atomic<bool> probe_result{false};

    void SetUp() override {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir = fs::temp_directory_path() / ("proxyvisor_supervisor_test_" + std::string(info->name()));
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
        config_path = (temp_dir / "config.yaml").string();
        std::ofstream(config_path) << "port: " << kPort << "\n";
    }

    void TearDown() override { fs::remove_all(temp_dir); }

    std::string write_script(const std::string &body) {
        fs::path path = temp_dir / "CLIProxyAPI";
        {
            std::ofstream script(path);
            script << "#!/bin/bash\n" << body << "\n";
        }
        chmod(path.c_str(), 0755);
        return path.string();
    }

    SupervisorOptions fast_options() {
        SupervisorOptions options;
        options.poll_interval_ms = 50;
        options.startup_timeout_ms = 3000;
        options.stop_timeout_ms = 1000;
        options.cancel_timeout_ms = 500;
        options.port_release_wait_ms = 10;
        return options;
    }

    ProcessSupervisor::IdentityProbe probe() {
        return [this]() { return probe_result.load(); };
    }
};

TEST_F(ProcessSupervisorTest, MissingBinaryIsPreconditionFailure) {
    ProcessSupervisor supervisor(ports, probe(), fast_options());

    auto status = supervisor.start((temp_dir / "missing").string(), config_path, kPort);
    EXPECT_EQ(status.code(), common::ErrorCode::PRECONDITION_FAILED);
    EXPECT_FALSE(supervisor.is_running());
}

TEST_F(ProcessSupervisorTest, MissingConfigIsPreconditionFailure) {
    auto binary = write_script("exec sleep 30");
    ProcessSupervisor supervisor(ports, probe(), fast_options());

    auto status = supervisor.start(binary, (temp_dir / "nope.yaml").string(), kPort);
    EXPECT_EQ(status.code(), common::ErrorCode::PRECONDITION_FAILED);
}

TEST_F(ProcessSupervisorTest, AdoptsRunningProxyWithoutSpawning) {
    auto binary = write_script("exit 1");
    probe_result = true;
    EXPECT_CALL(ports, is_listening(kPort)).WillRepeatedly(Return(true));
    EXPECT_CALL(ports, send_signal(_, _)).Times(0);

    ProcessSupervisor supervisor(ports, probe(), fast_options());

    ASSERT_TRUE(supervisor.start(binary, config_path, kPort));
    ASSERT_TRUE(supervisor.start(binary, config_path, kPort));

    auto snap = supervisor.snapshot();
    EXPECT_TRUE(snap.running);
    EXPECT_TRUE(snap.adopted);
    EXPECT_EQ(snap.port, kPort);
    EXPECT_EQ(snap.spawn_count, 0);
    EXPECT_FALSE(snap.child_pid.has_value());
}

TEST_F(ProcessSupervisorTest, ForeignListenerThatSurvivesIsPortConflict) {
    auto binary = write_script("exec sleep 30");
    probe_result = false;
    EXPECT_CALL(ports, is_listening(kPort)).WillRepeatedly(Return(true));
    EXPECT_CALL(ports, listening_pids(kPort)).WillOnce(Return(std::vector<pid_t>{4242}));
    EXPECT_CALL(ports, send_signal(4242, SIGKILL)).WillOnce(Return(true));

    ProcessSupervisor supervisor(ports, probe(), fast_options());

    auto status = supervisor.start(binary, config_path, kPort);
    EXPECT_EQ(status.code(), common::ErrorCode::PORT_CONFLICT);
    EXPECT_EQ(status.message(),
              "Port 18317 is already in use by another process. Please stop it or change the port.");
    EXPECT_EQ(supervisor.snapshot().spawn_count, 0);
}

TEST_F(ProcessSupervisorTest, EvictsForeignListenerThenSpawns) {
    auto binary = write_script("exec sleep 30");
    probe_result = false;
    EXPECT_CALL(ports, is_listening(kPort))
        .WillOnce(Return(true))   // foreign owner found
        .WillOnce(Return(false))  // released after SIGKILL
        .WillRepeatedly(Return(true));
    EXPECT_CALL(ports, listening_pids(kPort)).WillOnce(Return(std::vector<pid_t>{4242}));
    EXPECT_CALL(ports, send_signal(4242, SIGKILL)).WillOnce(Return(true));

    ProcessSupervisor supervisor(ports, probe(), fast_options());

    auto status = supervisor.start(binary, config_path, kPort);
    ASSERT_TRUE(status) << status.to_string();
    EXPECT_EQ(supervisor.snapshot().spawn_count, 1);

    supervisor.stop();
}

TEST_F(ProcessSupervisorTest, SpawnsAndBecomesReady) {
    auto binary = write_script("exec sleep 30");
    EXPECT_CALL(ports, is_listening(kPort)).WillOnce(Return(false)).WillRepeatedly(Return(true));

    ProcessSupervisor supervisor(ports, probe(), fast_options());

    auto status = supervisor.start(binary, config_path, kPort);
    ASSERT_TRUE(status) << status.to_string();

    auto snap = supervisor.snapshot();
    EXPECT_TRUE(snap.running);
    EXPECT_FALSE(snap.adopted);
    EXPECT_FALSE(snap.starting);
    EXPECT_EQ(snap.spawn_count, 1);
    ASSERT_TRUE(snap.child_pid.has_value());
    pid_t child = *snap.child_pid;
    EXPECT_EQ(kill(child, 0), 0);

    // A second start on the same port keeps the existing child
    ASSERT_TRUE(supervisor.start(binary, config_path, kPort));
    EXPECT_EQ(supervisor.snapshot().spawn_count, 1);

    supervisor.stop();
    EXPECT_FALSE(supervisor.is_running());
    EXPECT_FALSE(supervisor.snapshot().child_pid.has_value());
    EXPECT_NE(kill(child, 0), 0);
}

TEST_F(ProcessSupervisorTest, ExitDuringStartupReportsOutput) {
    auto binary = write_script("echo 'starting up'\necho 'bad config' >&2\nexit 2");
    EXPECT_CALL(ports, is_listening(kPort)).WillRepeatedly(Return(false));

    ProcessSupervisor supervisor(ports, probe(), fast_options());

    auto status = supervisor.start(binary, config_path, kPort);
    EXPECT_EQ(status.code(), common::ErrorCode::STARTUP_FAILED);
    EXPECT_EQ(status.message(),
              "Proxy failed to start: Process exited with code 2 | stderr: bad config | stdout: starting up");
    EXPECT_FALSE(supervisor.is_running());
}

TEST_F(ProcessSupervisorTest, SilentExitSaysNoOutput) {
    auto binary = write_script("exit 7");
    EXPECT_CALL(ports, is_listening(kPort)).WillRepeatedly(Return(false));

    ProcessSupervisor supervisor(ports, probe(), fast_options());

    auto status = supervisor.start(binary, config_path, kPort);
    EXPECT_EQ(status.message(), "Proxy failed to start: Process exited with code 7 | No error output available");
}

TEST_F(ProcessSupervisorTest, ReadinessTimeoutKillsChild) {
    auto binary = write_script("exec sleep 30");
    EXPECT_CALL(ports, is_listening(kPort)).WillRepeatedly(Return(false));

    auto options = fast_options();
    options.startup_timeout_ms = 300;
    ProcessSupervisor supervisor(ports, probe(), options);

    auto status = supervisor.start(binary, config_path, kPort);
    EXPECT_EQ(status.code(), common::ErrorCode::STARTUP_FAILED);
    EXPECT_NE(status.message().find("was not listening after 300ms"), std::string::npos);
    EXPECT_FALSE(supervisor.snapshot().child_pid.has_value());
}

TEST_F(ProcessSupervisorTest, CancelStartupFromAnotherThread) {
    auto binary = write_script("exec sleep 30");
    EXPECT_CALL(ports, is_listening(kPort)).WillRepeatedly(Return(false));

    auto options = fast_options();
    options.startup_timeout_ms = 20000;
    ProcessSupervisor supervisor(ports, probe(), options);

    auto result = std::async(std::launch::async, [&]() { return supervisor.start(binary, config_path, kPort); });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!supervisor.snapshot().child_pid && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(supervisor.snapshot().starting);

    // A concurrent start is refused while the first is in flight
    EXPECT_EQ(supervisor.start(binary, config_path, kPort).code(), common::ErrorCode::OPERATION_IN_PROGRESS);

    auto started_at = std::chrono::steady_clock::now();
    supervisor.cancel_startup();
    ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    auto status = result.get();
    EXPECT_EQ(status.code(), common::ErrorCode::CANCELLED);
    EXPECT_EQ(status.message(), "Startup cancelled by user");
    EXPECT_LT(std::chrono::steady_clock::now() - started_at, std::chrono::seconds(5));

    auto snap = supervisor.snapshot();
    EXPECT_FALSE(snap.starting);
    EXPECT_FALSE(snap.running);
    EXPECT_FALSE(snap.child_pid.has_value());
}

TEST_F(ProcessSupervisorTest, CancelWhenIdleIsNoop) {
    ProcessSupervisor supervisor(ports, probe(), fast_options());

    supervisor.cancel_startup();
    EXPECT_FALSE(supervisor.snapshot().starting);
    EXPECT_FALSE(supervisor.is_running());
}

TEST_F(ProcessSupervisorTest, DetectsChildExitAfterReady) {
    auto binary = write_script("sleep 0.3\necho 'panic: oops' >&2\nexit 4");
    EXPECT_CALL(ports, is_listening(kPort)).WillOnce(Return(false)).WillRepeatedly(Return(true));

    ProcessSupervisor supervisor(ports, probe(), fast_options());
    ASSERT_TRUE(supervisor.start(binary, config_path, kPort));
    EXPECT_FALSE(supervisor.check_child_exit().has_value());

    std::optional<std::string> exit_message;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!exit_message && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        exit_message = supervisor.check_child_exit();
    }

    ASSERT_TRUE(exit_message.has_value());
    EXPECT_NE(exit_message->find("code 4"), std::string::npos);
    EXPECT_NE(exit_message->find("panic: oops"), std::string::npos);
    EXPECT_FALSE(supervisor.is_running());
}

TEST_F(ProcessSupervisorTest, AdoptExistingRequiresIdentity) {
    EXPECT_CALL(ports, is_listening(kPort)).WillRepeatedly(Return(true));
    ProcessSupervisor supervisor(ports, probe(), fast_options());

    probe_result = false;
    EXPECT_FALSE(supervisor.adopt_existing(kPort));

    probe_result = true;
    EXPECT_TRUE(supervisor.adopt_existing(kPort));
    EXPECT_TRUE(supervisor.snapshot().adopted);
}

TEST_F(ProcessSupervisorTest, StopAdoptedProxySignalsPortOwner) {
    probe_result = true;
    EXPECT_CALL(ports, is_listening(kPort)).WillOnce(Return(true)).WillRepeatedly(Return(false));
    EXPECT_CALL(ports, listening_pids(kPort)).WillOnce(Return(std::vector<pid_t>{777}));
    EXPECT_CALL(ports, send_signal(777, SIGTERM)).WillOnce(Return(true));
    EXPECT_CALL(ports, send_signal(777, SIGKILL)).Times(0);

    ProcessSupervisor supervisor(ports, probe(), fast_options());
    ASSERT_TRUE(supervisor.adopt_existing(kPort));

    supervisor.stop();
    EXPECT_FALSE(supervisor.is_running());
    EXPECT_FALSE(supervisor.snapshot().adopted);
}

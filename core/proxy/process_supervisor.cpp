#include "process_supervisor.hpp"

#include <signal.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <thread>

#include "common/file_util.hpp"
#include "logging/logger.hpp"

namespace proxyvisor {
namespace proxy {

namespace {

bool contains_address_in_use(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text.find("address already in use") != std::string::npos;
}

}  // namespace

ProcessSupervisor::ProcessSupervisor(IPortInspector &ports, IdentityProbe probe, SupervisorOptions options)
    : ports_(ports), probe_(std::move(probe)), options_(options) {}

ProcessSupervisor::~ProcessSupervisor() {
    std::shared_ptr<ProxyProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        process = std::move(process_);
        cancel_requested_ = true;
    }
    cv_.notify_all();
    if (process) {
        process->terminate(options_.stop_timeout_ms);
    }
}

common::Status ProcessSupervisor::start(const std::string &binary_path, const std::string &config_path, int port) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (starting_) {
            return common::Status::error(common::ErrorCode::OPERATION_IN_PROGRESS, "Proxy startup already in progress");
        }
        if (running_ && port_ == port && !adopted_ && process_ && process_->is_running()) {
            LOG_DEBUG("[Supervisor] Proxy already running (PID=" << process_->pid() << ")");
            return common::Status::ok();
        }
        starting_ = true;
        cancel_requested_ = false;
    }

    common::Status status;
    try {
        status = start_impl(binary_path, config_path, port);
    } catch (const std::exception &e) {
        status = common::Status::error(common::ErrorCode::STARTUP_FAILED,
                                       std::string("Proxy failed to start: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    starting_ = false;
    cancel_requested_ = false;
    return status;
}

common::Status ProcessSupervisor::start_impl(const std::string &binary_path, const std::string &config_path, int port) {
    // 1. Preconditions
    if (!std::filesystem::exists(binary_path)) {
        return common::Status::error(common::ErrorCode::PRECONDITION_FAILED, "Binary not found at " + binary_path);
    }
    if (!common::is_executable_file(binary_path)) {
        return common::Status::error(common::ErrorCode::PRECONDITION_FAILED,
                                     "Binary is not executable: " + binary_path);
    }
    if (!std::filesystem::exists(config_path)) {
        return common::Status::error(common::ErrorCode::PRECONDITION_FAILED, "Config file not found at " + config_path);
    }

    // 2. Someone already on the port?
    if (ports_.is_listening(port)) {
        if (adopt_if_ours(port)) {
            return common::Status::ok();
        }
        auto evicted = evict_foreign_listener(port);
        if (!evicted) {
            return evicted;
        }
    }

    // A previous child that died on its own is dropped here
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel_requested_) {
            return common::Status::error(common::ErrorCode::CANCELLED, "Startup cancelled by user");
        }
        process_.reset();
        running_ = false;
        adopted_ = false;
    }

    // 3. Spawn
    const std::string working_dir = std::filesystem::path(binary_path).parent_path().string();
    auto process = std::make_shared<ProxyProcess>("proxy", binary_path,
                                                  std::vector<std::string>{"--config", config_path}, working_dir,
                                                  options_.output_tail_lines);
    if (!process->spawn()) {
        return common::Status::error(common::ErrorCode::SPAWN_FAILED,
                                     "Proxy failed to start: " + process->last_error());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++spawn_count_;
        process_ = process;
        if (cancel_requested_) {
            process_.reset();
        }
    }
    if (cancel_requested()) {
        process->terminate(options_.cancel_timeout_ms);
        return common::Status::error(common::ErrorCode::CANCELLED, "Startup cancelled by user");
    }

    // 4. Readiness poll
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.startup_timeout_ms);
    bool ready = false;
    bool exited = false;
    while (true) {
        if (!wait_cancellable(options_.poll_interval_ms)) {
            // cancel_startup() terminates the child; make sure it is gone before returning
            process->terminate(options_.cancel_timeout_ms);
            std::lock_guard<std::mutex> lock(mutex_);
            if (process_ == process) {
                process_.reset();
            }
            LOG_INFO("[Supervisor] Startup cancelled");
            return common::Status::error(common::ErrorCode::CANCELLED, "Startup cancelled by user");
        }

        process->drain_output();
        if (!process->is_running()) {
            exited = true;
            break;
        }
        if (ports_.is_listening(port)) {
            ready = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
    }

    // cancel_startup() may have killed the child between two polls
    if (!ready && cancel_requested()) {
        process->terminate(options_.cancel_timeout_ms);
        std::lock_guard<std::mutex> lock(mutex_);
        if (process_ == process) {
            process_.reset();
        }
        return common::Status::error(common::ErrorCode::CANCELLED, "Startup cancelled by user");
    }

    if (ready) {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = true;
        adopted_ = false;
        port_ = port;
        LOG_INFO("[Supervisor] Proxy listening on port " << port << " (PID=" << process->pid() << ")");
        return common::Status::ok();
    }

    // 5. Lost a startup race to another instance of our proxy?
    process->drain_output();
    const std::string combined = process->stderr_tail() + "\n" + process->stdout_tail();
    if (contains_address_in_use(combined) && ports_.is_listening(port)) {
        process->terminate(options_.cancel_timeout_ms);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (process_ == process) {
                process_.reset();
            }
        }
        if (adopt_if_ours(port)) {
            return common::Status::ok();
        }
    }

    std::string message;
    if (exited) {
        message = describe_failure(*process);
    } else {
        message = "Proxy failed to start: Port " + std::to_string(port) + " was not listening after " +
                  std::to_string(options_.startup_timeout_ms) + "ms";
        process->terminate(options_.cancel_timeout_ms);
        process->drain_output();
        std::string output = process->stderr_tail();
        if (!output.empty()) {
            message += " | stderr: " + output;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (process_ == process) {
            process_.reset();
        }
        running_ = false;
    }
    LOG_ERROR("[Supervisor] " << message);
    return common::Status::error(common::ErrorCode::STARTUP_FAILED, message);
}

bool ProcessSupervisor::adopt_if_ours(int port) {
    if (!probe_ || !probe_()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = true;
    port_ = port;
    // Keep our own child if it is the listener
    adopted_ = !(process_ && process_->is_running());
    LOG_INFO("[Supervisor] Proxy already running on port " << port << (adopted_ ? ", adopting it" : ""));
    return true;
}

bool ProcessSupervisor::adopt_existing(int port) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (starting_) {
            return false;
        }
    }
    return ports_.is_listening(port) && adopt_if_ours(port);
}

common::Status ProcessSupervisor::evict_foreign_listener(int port) {
    auto pids = ports_.listening_pids(port);
    for (pid_t pid : pids) {
        LOG_WARN("[Supervisor] Killing foreign process " << pid << " holding port " << port);
        ports_.send_signal(pid, SIGKILL);
    }

    if (!wait_cancellable(options_.port_release_wait_ms)) {
        return common::Status::error(common::ErrorCode::CANCELLED, "Startup cancelled by user");
    }

    if (ports_.is_listening(port)) {
        return common::Status::error(common::ErrorCode::PORT_CONFLICT,
                                     "Port " + std::to_string(port) +
                                         " is already in use by another process. Please stop it or change the port.");
    }
    return common::Status::ok();
}

std::string ProcessSupervisor::describe_failure(ProxyProcess &process) const {
    std::ostringstream message;
    message << "Proxy failed to start: Process exited with code " << process.exit_code().value_or(-1);

    const std::string err = process.stderr_tail();
    const std::string out = process.stdout_tail();
    if (err.empty() && out.empty()) {
        message << " | No error output available";
        return message.str();
    }
    if (!err.empty()) {
        message << " | stderr: " << err;
    }
    if (!out.empty()) {
        message << " | stdout: " << out;
    }
    return message.str();
}

void ProcessSupervisor::stop() {
    cancel_startup();

    std::shared_ptr<ProxyProcess> process;
    bool adopted = false;
    int port = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        process = std::move(process_);
        adopted = adopted_ && running_;
        port = port_;
        running_ = false;
        adopted_ = false;
    }

    if (process) {
        LOG_INFO("[Supervisor] Stopping proxy (PID=" << process->pid() << ")");
        process->terminate(options_.stop_timeout_ms);
    } else if (adopted) {
        stop_adopted_listener(port);
    }
}

void ProcessSupervisor::stop_adopted_listener(int port) {
    auto pids = ports_.listening_pids(port);
    if (pids.empty()) {
        LOG_WARN("[Supervisor] No visible owner for port " << port << ", nothing to stop");
        return;
    }
    for (pid_t pid : pids) {
        LOG_INFO("[Supervisor] Stopping adopted proxy (PID=" << pid << ")");
        ports_.send_signal(pid, SIGTERM);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.stop_timeout_ms);
    while (ports_.is_listening(port) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (ports_.is_listening(port)) {
        for (pid_t pid : pids) {
            LOG_WARN("[Supervisor] Adopted proxy " << pid << " ignored SIGTERM, sending SIGKILL");
            ports_.send_signal(pid, SIGKILL);
        }
    }
}

void ProcessSupervisor::cancel_startup() {
    std::shared_ptr<ProxyProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!starting_) {
            return;
        }
        cancel_requested_ = true;
        process = process_;
    }
    cv_.notify_all();

    LOG_INFO("[Supervisor] Cancelling startup");
    if (process) {
        process->terminate(options_.cancel_timeout_ms);
    }
}

std::optional<std::string> ProcessSupervisor::check_child_exit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || adopted_ || !process_ || starting_) {
        return std::nullopt;
    }
    if (process_->is_running()) {
        process_->drain_output();
        return std::nullopt;
    }

    std::string message = "Proxy exited unexpectedly with code " + std::to_string(process_->exit_code().value_or(-1));
    const std::string err = process_->stderr_tail();
    if (!err.empty()) {
        message += " | stderr: " + err;
    }
    process_.reset();
    running_ = false;
    return message;
}

ProcessSupervisor::Snapshot ProcessSupervisor::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Snapshot snap;
    snap.running = running_;
    snap.starting = starting_;
    snap.adopted = adopted_;
    snap.port = port_;
    snap.spawn_count = spawn_count_;
    if (process_) {
        snap.child_pid = process_->pid();
    }
    return snap;
}

bool ProcessSupervisor::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

bool ProcessSupervisor::wait_cancellable(int ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return cancel_requested_; });
}

bool ProcessSupervisor::cancel_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_requested_;
}

}  // namespace proxy
}  // namespace proxyvisor

#include "proxy_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>

#include "logging/logger.hpp"

namespace proxyvisor {
namespace proxy {

namespace {

// Longest line kept in a tail; longer ones keep their last bytes
constexpr size_t kMaxLineBytes = 4096;

void keep_line_end(std::string &line) {
    if (line.size() > kMaxLineBytes) {
        line.erase(0, line.size() - kMaxLineBytes);
    }
}

bool set_nonblocking_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return false;
    }
    int fd_flags = fcntl(fd, F_GETFD, 0);
    return fd_flags >= 0 && fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC) >= 0;
}

}  // namespace

ProxyProcess::ProxyProcess(const std::string &tag, const std::string &executable_path,
                           const std::vector<std::string> &args, const std::string &working_dir,
                           size_t max_tail_lines)
    : tag_(tag),
      executable_path_(executable_path),
      args_(args),
      working_dir_(working_dir),
      max_tail_lines_(max_tail_lines == 0 ? 1 : max_tail_lines) {}

ProxyProcess::~ProxyProcess() {
    if (is_running()) {
        terminate(1000);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    close_pipes_locked();
}

bool ProxyProcess::spawn() {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_INFO("[" << tag_ << "] Spawning: " << executable_path_);

    if (pid_ > 0 && !exit_code_) {
        error_ = "Process already running (PID=" + std::to_string(pid_) + ")";
        return false;
    }
    if (!std::filesystem::exists(executable_path_)) {
        error_ = "Executable not found: " + executable_path_;
        LOG_ERROR("[" << tag_ << "] " << error_);
        return false;
    }

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe(stdout_pipe) < 0) {
        error_ = std::string("Failed to create stdout pipe: ") + std::strerror(errno);
        return false;
    }
    if (pipe(stderr_pipe) < 0) {
        error_ = std::string("Failed to create stderr pipe: ") + std::strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return false;
    }

    std::string abs_path = std::filesystem::absolute(executable_path_).string();
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(abs_path.c_str()));
    for (const auto &arg : args_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        error_ = std::string("Fork failed: ") + std::strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Child process: only async-signal-safe calls from here on
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);

        if (!working_dir_.empty() && chdir(working_dir_.c_str()) != 0) {
            _exit(126);
        }

        execv(abs_path.c_str(), argv.data());

        // If we get here, exec failed
        _exit(127);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    if (!set_nonblocking_cloexec(stdout_pipe[0]) || !set_nonblocking_cloexec(stderr_pipe[0])) {
        LOG_WARN("[" << tag_ << "] Could not switch output pipes to non-blocking mode");
    }

    pid_ = pid;
    exit_code_.reset();
    stdout_ = OutputTail{};
    stderr_ = OutputTail{};
    stdout_.fd = stdout_pipe[0];
    stderr_.fd = stderr_pipe[0];
    error_.clear();

    LOG_INFO("[" << tag_ << "] Process spawned successfully (PID=" << pid_ << ")");
    return true;
}

bool ProxyProcess::is_running() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || exit_code_) {
        return false;
    }
    return !reap_locked(false);
}

std::optional<int> ProxyProcess::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

void ProxyProcess::drain_output() {
    std::lock_guard<std::mutex> lock(mutex_);
    drain_locked(stdout_);
    drain_locked(stderr_);
}

bool ProxyProcess::wait_for_exit(int timeout_ms) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pid_ <= 0 || exit_code_) {
                return true;
            }
            drain_locked(stdout_);
            drain_locked(stderr_);
            if (reap_locked(false)) {
                return true;
            }
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool ProxyProcess::terminate(int grace_ms) {
    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pid_ <= 0 || exit_code_) {
            return true;
        }
        pid = pid_;
    }

    LOG_INFO("[" << tag_ << "] Terminating PID " << pid);
    kill(pid, SIGTERM);
    if (wait_for_exit(grace_ms)) {
        LOG_INFO("[" << tag_ << "] Clean shutdown");
        return true;
    }

    LOG_WARN("[" << tag_ << "] Timeout - forcing termination");
    kill(pid, SIGKILL);
    if (wait_for_exit(500)) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    error_ = "Process " + std::to_string(pid) + " did not exit after SIGKILL";
    LOG_ERROR("[" << tag_ << "] " << error_);
    return false;
}

std::string ProxyProcess::stdout_tail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return join_locked(stdout_);
}

std::string ProxyProcess::stderr_tail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return join_locked(stderr_);
}

pid_t ProxyProcess::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

std::string ProxyProcess::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

bool ProxyProcess::reap_locked(bool block) {
    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, block ? 0 : WNOHANG);
        if (result == pid_) {
            if (WIFEXITED(status)) {
                exit_code_ = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_code_ = 128 + WTERMSIG(status);
            } else {
                continue;  // stopped/continued, still alive
            }
            // Collect the last words before the pipes go away
            drain_locked(stdout_);
            drain_locked(stderr_);
            LOG_DEBUG("[" << tag_ << "] PID " << pid_ << " exited with code " << *exit_code_);
            return true;
        }
        if (result == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == ECHILD) {
            // Reaped elsewhere; exit status is lost
            exit_code_ = -1;
            return true;
        }
        return false;
    }
}

void ProxyProcess::drain_locked(OutputTail &tail) {
    if (tail.fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        ssize_t n = read(tail.fd, buffer, sizeof(buffer));
        if (n > 0) {
            for (ssize_t i = 0; i < n; ++i) {
                if (buffer[i] == '\n') {
                    keep_line_end(tail.partial);
                    push_line_locked(tail, std::move(tail.partial));
                    tail.partial.clear();
                } else if (buffer[i] != '\r') {
                    tail.partial.push_back(buffer[i]);
                }
            }
            keep_line_end(tail.partial);
            continue;
        }
        if (n == 0) {
            // EOF: writer side closed
            close(tail.fd);
            tail.fd = -1;
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        // EAGAIN/EWOULDBLOCK: nothing more right now
        return;
    }
}

void ProxyProcess::push_line_locked(OutputTail &tail, std::string line) {
    tail.lines.push_back(std::move(line));
    while (tail.lines.size() > max_tail_lines_) {
        tail.lines.pop_front();
    }
}

std::string ProxyProcess::join_locked(const OutputTail &tail) const {
    std::string out;
    for (const auto &line : tail.lines) {
        if (!out.empty()) {
            out += "\n";
        }
        out += line;
    }
    if (!tail.partial.empty()) {
        if (!out.empty()) {
            out += "\n";
        }
        out += tail.partial;
    }
    return out;
}

void ProxyProcess::close_pipes_locked() {
    if (stdout_.fd >= 0) {
        close(stdout_.fd);
        stdout_.fd = -1;
    }
    if (stderr_.fd >= 0) {
        close(stderr_.fd);
        stderr_.fd = -1;
    }
}

}  // namespace proxy
}  // namespace proxyvisor

#include "notify_send_notifier.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <vector>

#include "logging/logger.hpp"

namespace proxyvisor {
namespace notify {

NotifySendNotifier::NotifySendNotifier(std::string app_name, std::string command)
    : app_name_(std::move(app_name)), command_(std::move(command)) {}

bool NotifySendNotifier::notify(const Notification &notification) {
    std::vector<std::string> args = {command_, "--app-name=" + app_name_, notification.title, notification.body};
    std::vector<char *> argv;
    for (auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // Close-on-exec pipe: EOF means the exec succeeded, an int means it failed with that errno
    int exec_pipe[2];
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        LOG_WARN("[Notify] pipe failed: errno " << errno);
        return false;
    }

    // Double fork so the notifier is reparented to init and never left as a zombie
    pid_t pid = fork();
    if (pid < 0) {
        LOG_WARN("[Notify] fork failed: errno " << errno);
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        return false;
    }
    if (pid == 0) {
        close(exec_pipe[0]);
        pid_t grandchild = fork();
        if (grandchild != 0) {
            _exit(grandchild < 0 ? 1 : 0);
        }
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        execvp(argv[0], argv.data());
        int exec_errno = errno;
        ssize_t written = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)written;
        _exit(127);
    }
    close(exec_pipe[1]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            LOG_WARN("[Notify] waitpid failed: errno " << errno);
            close(exec_pipe[0]);
            return false;
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        LOG_WARN("[Notify] Could not launch " << command_);
        close(exec_pipe[0]);
        return false;
    }

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);
    if (n != 0) {
        LOG_WARN("[Notify] Could not run " << command_ << ": errno " << (n > 0 ? exec_errno : errno));
        return false;
    }

    LOG_DEBUG("[Notify] " << notification.title << ": " << notification.body);
    return true;
}

}  // namespace notify
}  // namespace proxyvisor

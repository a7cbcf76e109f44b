#include "port_inspector.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>

#include "logging/logger.hpp"

namespace proxyvisor {
namespace proxy {

namespace {

constexpr const char *kTcpListenState = "0A";

// Collect socket inodes in LISTEN state bound to port from a /proc/net/tcp-style table
void collect_listen_inodes(const std::string &table, int port, std::set<unsigned long> &inodes) {
    std::ifstream in(table);
    if (!in) {
        return;
    }

    std::string line;
    std::getline(in, line);  // header
    while (std::getline(in, line)) {
        std::istringstream row(line);
        std::string slot, local, remote, state, queues, timer, retrnsmt, uid, timeout;
        unsigned long inode = 0;
        if (!(row >> slot >> local >> remote >> state >> queues >> timer >> retrnsmt >> uid >> timeout >> inode)) {
            continue;
        }
        if (state != kTcpListenState) {
            continue;
        }
        auto colon = local.rfind(':');
        if (colon == std::string::npos) {
            continue;
        }
        long local_port = std::strtol(local.substr(colon + 1).c_str(), nullptr, 16);
        if (local_port == port && inode != 0) {
            inodes.insert(inode);
        }
    }
}

}  // namespace

SystemPortInspector::SystemPortInspector(int connect_timeout_ms) : connect_timeout_ms_(connect_timeout_ms) {}

bool SystemPortInspector::is_listening(int port) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        LOG_WARN("[PortInspector] socket() failed: " << errno);
        return false;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    bool listening = false;
    int rc = connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    if (rc == 0) {
        listening = true;
    } else if (errno == EINPROGRESS) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int ready;
        do {
            ready = poll(&pfd, 1, connect_timeout_ms_);
        } while (ready < 0 && errno == EINTR);

        if (ready > 0) {
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0) {
                listening = true;
            }
        }
    }

    close(fd);
    return listening;
}

std::vector<pid_t> SystemPortInspector::listening_pids(int port) {
    std::set<unsigned long> inodes;
    collect_listen_inodes("/proc/net/tcp", port, inodes);
    collect_listen_inodes("/proc/net/tcp6", port, inodes);

    std::vector<pid_t> pids;
    if (inodes.empty()) {
        return pids;
    }

    const pid_t self = getpid();
    namespace fs = std::filesystem;
    std::error_code ec;
    for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path proc_dir = it->path();
        const std::string name = proc_dir.filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), ::isdigit)) {
            continue;
        }
        pid_t pid = static_cast<pid_t>(std::atoi(name.c_str()));
        if (pid == self) {
            continue;
        }

        std::error_code fd_ec;
        for (fs::directory_iterator fd_it(proc_dir / "fd", fd_ec), fd_end; !fd_ec && fd_it != fd_end;
             fd_it.increment(fd_ec)) {
            std::error_code link_ec;
            auto target = fs::read_symlink(fd_it->path(), link_ec).string();
            if (link_ec || target.rfind("socket:[", 0) != 0) {
                continue;
            }
            unsigned long inode = std::strtoul(target.c_str() + 8, nullptr, 10);
            if (inodes.count(inode) > 0) {
                pids.push_back(pid);
                break;
            }
        }
    }

    if (pids.empty()) {
        LOG_DEBUG("[PortInspector] Port " << port << " is bound but no owning PID is visible (permissions?)");
    }
    return pids;
}

bool SystemPortInspector::send_signal(pid_t pid, int signal) {
    if (pid <= 0 || pid == getpid()) {
        return false;
    }
    if (kill(pid, signal) != 0) {
        LOG_WARN("[PortInspector] kill(" << pid << ", " << signal << ") failed: errno " << errno);
        return false;
    }
    return true;
}

}  // namespace proxy
}  // namespace proxyvisor

#pragma once

#include <sys/types.h>

#include <vector>

namespace proxyvisor {
namespace proxy {

// OS view of a local TCP port. Mocked in supervisor tests.
class IPortInspector {
public:
    virtual ~IPortInspector() = default;

    // True if something accepts TCP connections on 127.0.0.1:port
    virtual bool is_listening(int port) = 0;

    // PIDs owning a listening socket on port, never including our own
    virtual std::vector<pid_t> listening_pids(int port) = 0;

    // Deliver signal to pid. Returns false if the process could not be signalled.
    virtual bool send_signal(pid_t pid, int signal) = 0;
};

// Linux implementation: connect() probe plus /proc/net/tcp{,6} inode scan
class SystemPortInspector : public IPortInspector {
public:
    explicit SystemPortInspector(int connect_timeout_ms = 250);

    bool is_listening(int port) override;
    std::vector<pid_t> listening_pids(int port) override;
    bool send_signal(pid_t pid, int signal) override;

private:
    int connect_timeout_ms_;
};

}  // namespace proxy
}  // namespace proxyvisor

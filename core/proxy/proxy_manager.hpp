#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "notify/notifier.hpp"
#include "proxy/binary_installer.hpp"
#include "proxy/management_api.hpp"
#include "proxy/management_config.hpp"
#include "proxy/port_inspector.hpp"
#include "proxy/process_supervisor.hpp"
#include "proxy/release_source.hpp"

namespace proxyvisor {
namespace runtime {
class EventLoop;
class WorkerPool;
}  // namespace runtime

namespace proxy {

struct ProxyStatus {
    bool running = false;
    int port = 8317;
};

struct AuthCommandResult {
    bool success = false;
    std::string message;
    std::optional<std::string> device_code;
};

struct ProxyManagerOptions {
    std::string data_dir;                  // Binary, config.yaml, management_key
    std::string auth_dir;                  // Credential directory handed to the proxy
    std::string binary_name = "CLIProxyAPI";
    int port = 8317;                       // Used when config.yaml does not exist yet
    std::string asset_keyword = "cliproxyapiplus";
    size_t min_binary_size = 1000;
    int auth_command_timeout_ms = 60000;
    SupervisorOptions supervisor;
};

// Fixed set of proxy subcommands that may be run on the user's behalf
const std::vector<std::string> &allowed_auth_commands();
bool is_allowed_auth_command(const std::string &command);

// Device code from auth command output, if any
std::optional<std::string> extract_device_code(const std::string &output);

/**
 * @brief Lifecycle facade over installer, supervisor and proxy config
 *
 * Owns ProxyStatus and last_error. Blocking operations (install, start,
 * auth commands) run on the caller's thread; the *_async variants run them
 * on a WorkerPool and deliver the Status on the EventLoop thread.
 *
 * Thread safety: status(), last_error(), urls and cancel_startup() may be
 * called from any thread.
 */
class ProxyManager {
public:
    using ManagementApiFactory = std::function<std::shared_ptr<IManagementApi>(int port, const std::string &key)>;
    using Completion = std::function<void(common::Status)>;

    ProxyManager(ProxyManagerOptions options, IReleaseSource &release_source, IPortInspector &ports,
                 notify::INotifier *notifier = nullptr, ManagementApiFactory api_factory = nullptr);
    ~ProxyManager();

    ProxyManager(const ProxyManager &) = delete;
    ProxyManager &operator=(const ProxyManager &) = delete;

    // Create data dir (0700), management key (0600) and config.yaml (0600) if missing
    common::Status prepare();

    common::Status install();
    common::Status start();
    void stop();
    void cancel_startup();

    void install_async(runtime::WorkerPool &pool, runtime::EventLoop &loop, Completion done);
    void start_async(runtime::WorkerPool &pool, runtime::EventLoop &loop, Completion done);

    // Authenticated GET {management_url}/auth-files answered 200
    bool check_responding();

    // Mark an already-running proxy on the configured port as ours (used by `stop` from a new process)
    bool attach();

    // Detect an unexpected exit of our child; returns the error it recorded
    std::optional<std::string> poll_health();

    common::Status set_port(int port);

    common::Status run_auth_command(const std::string &command, AuthCommandResult &result);

    ProxyStatus status() const;
    std::string last_error() const;
    bool is_binary_installed() const;
    bool is_starting() const;

    std::string base_url() const;
    std::string management_url() const;
    std::string binary_path() const;
    std::string config_path() const;
    std::string management_key_path() const;

    // Valid after prepare()
    std::shared_ptr<IManagementApi> management_api() const;

private:
    void set_last_error(const std::string &error);
    void notify(const std::string &id, const std::string &title, const std::string &body);

    ProxyManagerOptions options_;
    notify::INotifier *notifier_;
    ManagementApiFactory api_factory_;

    BinaryInstaller installer_;
    ProcessSupervisor supervisor_;

    mutable std::mutex mutex_;
    ProxyStatus status_;
    std::string last_error_;
    std::string management_key_;
    std::shared_ptr<IManagementApi> management_api_;
};

}  // namespace proxy
}  // namespace proxyvisor

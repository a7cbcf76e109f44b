#pragma once

#include <string>

namespace proxyvisor {
namespace runtime {

struct PathsConfig {
    std::string data_dir = "~/.local/share/proxyvisor";  // Binary, proxy config, management key (0700)
    std::string auth_dir = "~/.cli-proxy-api";           // Provider credential files read by the proxy
    std::string settings_file;                           // Empty: <data_dir>/settings.json
};

struct ProxyConfig {
    int port = 8317;                        // Proxy listen port (1024-65535)
    int poll_interval_ms = 500;             // Readiness poll step
    int startup_timeout_ms = 3000;          // Readiness deadline
    int stop_timeout_ms = 5000;             // SIGTERM grace before SIGKILL on stop
    int cancel_timeout_ms = 2000;           // SIGTERM grace before SIGKILL on cancel
    int port_release_wait_ms = 500;         // Wait after killing a foreign port owner
    int health_check_interval_ms = 5000;    // Foreground health check period
    int output_tail_lines = 10;             // Lines of child output kept for error messages
};

struct ReleaseConfig {
    std::string api_url = "https://api.github.com";
    std::string repo = "router-for-me/CLIProxyAPIPlus";
    std::string asset_keyword = "cliproxyapiplus";  // Required (case-insensitive) substring of the asset name
    std::string binary_name = "CLIProxyAPI";        // Installed file name under data_dir
    size_t min_binary_size = 1000;                  // Smaller binaries are treated as corrupt
    int timeout_ms = 60000;                         // Per-request read timeout
};

struct QuotaConfig {
    double alert_threshold = 20.0;  // Percent remaining at or below which an alert fires
    bool notify_on_low = true;
    bool notifications_enabled = true;
};

struct WorkersConfig {
    int threads = 4;  // Worker pool size (1-64)
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct AppConfig {
    PathsConfig paths;
    ProxyConfig proxy;
    ReleaseConfig release;
    QuotaConfig quota;
    WorkersConfig workers;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, AppConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const AppConfig &config, std::string &error);

// Expands a leading "~" to $HOME
std::string expand_home(const std::string &path);

}  // namespace runtime
}  // namespace proxyvisor

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/status.hpp"

namespace proxyvisor {
namespace proxy {

struct QuotaExceededPolicy {
    bool switch_project = true;
    bool switch_preview_model = true;
};

struct RetryPolicy {
    int request_retry = 3;
    int max_retry_interval = 30;  // seconds
};

// Contents of the proxy's config.yaml
struct ManagementConfig {
    std::string host = "127.0.0.1";
    int port = 8317;
    std::string auth_dir;
    std::string proxy_url;
    std::vector<std::string> api_keys;
    bool allow_remote_management = false;
    std::string management_secret;
    bool debug = false;
    bool logging_to_file = false;
    bool usage_statistics_enabled = true;
    std::string routing_strategy = "round-robin";
    QuotaExceededPolicy quota_exceeded;
    RetryPolicy retry;
};

// Render as YAML (yaml-cpp emitter)
std::string render_management_config(const ManagementConfig &config);

// Parse a config.yaml written by us or edited by hand
bool parse_management_config(const std::string &yaml_text, ManagementConfig &config, std::string &error);

// Write config with mode 0600 unless it already exists. Returns true in `created` if written.
common::Status ensure_management_config(const std::string &path, const ManagementConfig &defaults, bool &created);

// Rewrite only the top-level `port:` line, preserving everything else and mode 0600
common::Status update_config_port(const std::string &path, int port);

// Top-level port from the file, if present
std::optional<int> read_config_port(const std::string &path);

// Load the management secret from key_path, generating and storing (0600) a new one if absent
common::Status load_or_create_management_key(const std::string &key_path, std::string &key);

// 32 random bytes, hex encoded
std::string generate_management_key();

}  // namespace proxy
}  // namespace proxyvisor

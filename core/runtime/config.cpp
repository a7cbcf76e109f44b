#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <vector>

#include "logging/logger.hpp"

namespace proxyvisor {
namespace runtime {

std::string expand_home(const std::string &path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;  // ~user form is not supported
    }
    const char *home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return path;
    }
    return std::string(home) + path.substr(1);
}

bool validate_config(const AppConfig &config, std::string &error) {
    if (config.paths.data_dir.empty()) {
        error = "paths.data_dir must not be empty";
        return false;
    }
    if (config.paths.auth_dir.empty()) {
        error = "paths.auth_dir must not be empty";
        return false;
    }

    if (config.proxy.port < 1024 || config.proxy.port > 65535) {
        error = "proxy.port must be between 1024 and 65535";
        return false;
    }
    if (config.proxy.poll_interval_ms < 10) {
        error = "proxy.poll_interval_ms must be >= 10";
        return false;
    }
    if (config.proxy.startup_timeout_ms < config.proxy.poll_interval_ms) {
        error = "proxy.startup_timeout_ms must be >= proxy.poll_interval_ms";
        return false;
    }
    if (config.proxy.stop_timeout_ms < 0 || config.proxy.cancel_timeout_ms < 0 ||
        config.proxy.port_release_wait_ms < 0) {
        error = "proxy timeouts must not be negative";
        return false;
    }
    if (config.proxy.health_check_interval_ms < 100) {
        error = "proxy.health_check_interval_ms must be >= 100";
        return false;
    }
    if (config.proxy.output_tail_lines < 1) {
        error = "proxy.output_tail_lines must be >= 1";
        return false;
    }

    if (config.release.repo.find('/') == std::string::npos) {
        error = "release.repo must be of the form <owner>/<name>";
        return false;
    }
    if (config.release.api_url.rfind("https://", 0) != 0) {
        error = "release.api_url must use https";
        return false;
    }
    if (config.release.binary_name.empty() || config.release.binary_name.find('/') != std::string::npos) {
        error = "release.binary_name must be a plain file name";
        return false;
    }
    if (config.release.timeout_ms < 1000) {
        error = "release.timeout_ms must be >= 1000";
        return false;
    }

    if (config.quota.alert_threshold < 0.0 || config.quota.alert_threshold > 100.0) {
        error = "quota.alert_threshold must be between 0 and 100";
        return false;
    }

    if (config.workers.threads < 1 || config.workers.threads > 64) {
        error = "workers.threads must be between 1 and 64";
        return false;
    }

    const std::string &level = config.logging.level;
    if (level != "debug" && level != "info" && level != "warn" && level != "error" && level != "none") {
        error = "logging.level must be one of: debug, info, warn, error, none";
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, AppConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"paths", "proxy", "release", "quota", "workers", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        if (yaml["paths"]) {
            const auto &paths = yaml["paths"];
            if (paths["data_dir"]) config.paths.data_dir = paths["data_dir"].as<std::string>();
            if (paths["auth_dir"]) config.paths.auth_dir = paths["auth_dir"].as<std::string>();
            if (paths["settings_file"]) config.paths.settings_file = paths["settings_file"].as<std::string>();
        }

        if (yaml["proxy"]) {
            const auto &proxy = yaml["proxy"];
            if (proxy["port"]) config.proxy.port = proxy["port"].as<int>();
            if (proxy["poll_interval_ms"]) config.proxy.poll_interval_ms = proxy["poll_interval_ms"].as<int>();
            if (proxy["startup_timeout_ms"]) config.proxy.startup_timeout_ms = proxy["startup_timeout_ms"].as<int>();
            if (proxy["stop_timeout_ms"]) config.proxy.stop_timeout_ms = proxy["stop_timeout_ms"].as<int>();
            if (proxy["cancel_timeout_ms"]) config.proxy.cancel_timeout_ms = proxy["cancel_timeout_ms"].as<int>();
            if (proxy["port_release_wait_ms"]) {
                config.proxy.port_release_wait_ms = proxy["port_release_wait_ms"].as<int>();
            }
            if (proxy["health_check_interval_ms"]) {
                config.proxy.health_check_interval_ms = proxy["health_check_interval_ms"].as<int>();
            }
            if (proxy["output_tail_lines"]) config.proxy.output_tail_lines = proxy["output_tail_lines"].as<int>();
        }

        if (yaml["release"]) {
            const auto &release = yaml["release"];
            if (release["api_url"]) config.release.api_url = release["api_url"].as<std::string>();
            if (release["repo"]) config.release.repo = release["repo"].as<std::string>();
            if (release["asset_keyword"]) config.release.asset_keyword = release["asset_keyword"].as<std::string>();
            if (release["binary_name"]) config.release.binary_name = release["binary_name"].as<std::string>();
            if (release["min_binary_size"]) config.release.min_binary_size = release["min_binary_size"].as<size_t>();
            if (release["timeout_ms"]) config.release.timeout_ms = release["timeout_ms"].as<int>();
        }

        if (yaml["quota"]) {
            const auto &quota = yaml["quota"];
            if (quota["alert_threshold"]) config.quota.alert_threshold = quota["alert_threshold"].as<double>();
            if (quota["notify_on_low"]) config.quota.notify_on_low = quota["notify_on_low"].as<bool>();
            if (quota["notifications_enabled"]) {
                config.quota.notifications_enabled = quota["notifications_enabled"].as<bool>();
            }
        }

        if (yaml["workers"] && yaml["workers"]["threads"]) {
            config.workers.threads = yaml["workers"]["threads"].as<int>();
        }

        if (yaml["logging"] && yaml["logging"]["level"]) {
            config.logging.level = yaml["logging"]["level"].as<std::string>();
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Data dir: " << config.paths.data_dir << ", auth dir: " << config.paths.auth_dir);
        LOG_INFO("[Config] Proxy port: " << config.proxy.port << " (startup timeout " << config.proxy.startup_timeout_ms
                                         << "ms, poll " << config.proxy.poll_interval_ms << "ms)");
        LOG_INFO("[Config] Release source: " << config.release.api_url << "/repos/" << config.release.repo);

        std::stringstream quota_msg;
        quota_msg << "[Config] Quota alerts: " << (config.quota.notify_on_low ? "enabled" : "disabled");
        if (config.quota.notify_on_low) {
            quota_msg << " (threshold " << config.quota.alert_threshold << "%)";
        }
        LOG_INFO(quota_msg.str());

        LOG_INFO("[Config] Worker threads: " << config.workers.threads);
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace proxyvisor

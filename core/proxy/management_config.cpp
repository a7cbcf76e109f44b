#include "management_config.hpp"

#include <openssl/rand.h>
#include <sys/stat.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <filesystem>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "common/file_util.hpp"
#include "logging/logger.hpp"

namespace proxyvisor {
namespace proxy {

namespace {

std::string trim(const std::string &s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

}  // namespace

std::string render_management_config(const ManagementConfig &config) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "host" << YAML::Value << YAML::DoubleQuoted << config.host;
    out << YAML::Key << "port" << YAML::Value << config.port;
    out << YAML::Key << "auth-dir" << YAML::Value << YAML::DoubleQuoted << config.auth_dir;
    out << YAML::Key << "proxy-url" << YAML::Value << YAML::DoubleQuoted << config.proxy_url;

    out << YAML::Key << "api-keys" << YAML::Value << YAML::BeginSeq;
    for (const auto &key : config.api_keys) {
        out << YAML::DoubleQuoted << key;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "remote-management" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "allow-remote" << YAML::Value << config.allow_remote_management;
    out << YAML::Key << "secret-key" << YAML::Value << YAML::DoubleQuoted << config.management_secret;
    out << YAML::EndMap;

    out << YAML::Key << "debug" << YAML::Value << config.debug;
    out << YAML::Key << "logging-to-file" << YAML::Value << config.logging_to_file;
    out << YAML::Key << "usage-statistics-enabled" << YAML::Value << config.usage_statistics_enabled;

    out << YAML::Key << "routing" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "strategy" << YAML::Value << YAML::DoubleQuoted << config.routing_strategy;
    out << YAML::EndMap;

    out << YAML::Key << "quota-exceeded" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "switch-project" << YAML::Value << config.quota_exceeded.switch_project;
    out << YAML::Key << "switch-preview-model" << YAML::Value << config.quota_exceeded.switch_preview_model;
    out << YAML::EndMap;

    out << YAML::Key << "request-retry" << YAML::Value << config.retry.request_retry;
    out << YAML::Key << "max-retry-interval" << YAML::Value << config.retry.max_retry_interval;
    out << YAML::EndMap;

    return std::string(out.c_str()) + "\n";
}

bool parse_management_config(const std::string &yaml_text, ManagementConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::Load(yaml_text);
        if (!yaml.IsMap()) {
            error = "Proxy config is not a YAML mapping";
            return false;
        }

        if (yaml["host"]) config.host = yaml["host"].as<std::string>();
        if (yaml["port"]) config.port = yaml["port"].as<int>();
        if (yaml["auth-dir"]) config.auth_dir = yaml["auth-dir"].as<std::string>();
        if (yaml["proxy-url"]) config.proxy_url = yaml["proxy-url"].as<std::string>();
        if (yaml["api-keys"]) {
            config.api_keys.clear();
            for (const auto &key : yaml["api-keys"]) {
                config.api_keys.push_back(key.as<std::string>());
            }
        }
        if (const auto remote = yaml["remote-management"]) {
            if (remote["allow-remote"]) config.allow_remote_management = remote["allow-remote"].as<bool>();
            if (remote["secret-key"]) config.management_secret = remote["secret-key"].as<std::string>();
        }
        if (yaml["debug"]) config.debug = yaml["debug"].as<bool>();
        if (yaml["logging-to-file"]) config.logging_to_file = yaml["logging-to-file"].as<bool>();
        if (yaml["usage-statistics-enabled"]) {
            config.usage_statistics_enabled = yaml["usage-statistics-enabled"].as<bool>();
        }
        if (yaml["routing"] && yaml["routing"]["strategy"]) {
            config.routing_strategy = yaml["routing"]["strategy"].as<std::string>();
        }
        if (const auto qe = yaml["quota-exceeded"]) {
            if (qe["switch-project"]) config.quota_exceeded.switch_project = qe["switch-project"].as<bool>();
            if (qe["switch-preview-model"]) {
                config.quota_exceeded.switch_preview_model = qe["switch-preview-model"].as<bool>();
            }
        }
        if (yaml["request-retry"]) config.retry.request_retry = yaml["request-retry"].as<int>();
        if (yaml["max-retry-interval"]) config.retry.max_retry_interval = yaml["max-retry-interval"].as<int>();
        return true;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Proxy config error: " + std::string(e.what());
        return false;
    }
}

common::Status ensure_management_config(const std::string &path, const ManagementConfig &defaults, bool &created) {
    created = false;
    if (std::filesystem::exists(path)) {
        // Tighten permissions left behind by older installs or manual edits
        if (chmod(path.c_str(), 0600) != 0) {
            LOG_WARN("[ProxyConfig] Cannot restrict permissions on " << path);
        }
        return common::Status::ok();
    }

    auto status = common::write_file_atomic(path, render_management_config(defaults), 0600);
    if (!status) {
        return status;
    }
    created = true;
    LOG_INFO("[ProxyConfig] Created " << path << " (port " << defaults.port << ")");
    return common::Status::ok();
}

common::Status update_config_port(const std::string &path, int port) {
    if (port < 1024 || port > 65535) {
        return common::Status::error(common::ErrorCode::INVALID_ARGUMENT,
                                     "Port must be between 1024 and 65535, got " + std::to_string(port));
    }

    std::string text;
    if (!common::read_file(path, text)) {
        return common::Status::error(common::ErrorCode::PRECONDITION_FAILED, "Config file not found at " + path);
    }

    // Only an unindented `port:` line is the proxy's listen port
    static const std::regex port_line(R"(^port:[ \t]*\d+[ \t]*$)");
    std::istringstream in(text);
    std::ostringstream out;
    std::string line;
    bool replaced = false;
    while (std::getline(in, line)) {
        if (!replaced && std::regex_match(line, port_line)) {
            out << "port: " << port << "\n";
            replaced = true;
        } else {
            out << line << "\n";
        }
    }
    if (!replaced) {
        out << "port: " << port << "\n";
    }

    auto status = common::write_file_atomic(path, out.str(), 0600);
    if (status) {
        LOG_INFO("[ProxyConfig] Port set to " << port);
    }
    return status;
}

std::optional<int> read_config_port(const std::string &path) {
    std::string text;
    if (!common::read_file(path, text)) {
        return std::nullopt;
    }
    ManagementConfig config;
    std::string error;
    config.port = -1;
    if (!parse_management_config(text, config, error) || config.port <= 0) {
        return std::nullopt;
    }
    return config.port;
}

std::string generate_management_key() {
    unsigned char bytes[32];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return common::to_hex(bytes, sizeof(bytes));
}

common::Status load_or_create_management_key(const std::string &key_path, std::string &key) {
    std::string stored;
    if (common::read_file(key_path, stored)) {
        stored = trim(stored);
        if (!stored.empty()) {
            key = stored;
            return common::Status::ok();
        }
        LOG_WARN("[ProxyConfig] Management key file is empty, generating a new key");
    }

    std::string fresh;
    try {
        fresh = generate_management_key();
    } catch (const std::exception &e) {
        return common::Status::error(common::ErrorCode::IO_ERROR,
                                     std::string("Cannot generate management key: ") + e.what());
    }

    auto status = common::write_file_atomic(key_path, fresh + "\n", 0600);
    if (!status) {
        return status;
    }
    key = fresh;
    LOG_INFO("[ProxyConfig] Generated new management key");
    return common::Status::ok();
}

}  // namespace proxy
}  // namespace proxyvisor

// proxyvisor
// Proxy binary lifecycle manager with quota refresh and warmup

#include <chrono>
#include <filesystem>
#include <future>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

#include "common/status.hpp"
#include "logging/logger.hpp"
#include "runtime/app_context.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"

namespace {

using proxyvisor::common::ErrorCode;
using proxyvisor::common::Status;

void print_usage() {
    std::cerr << "Usage: proxyvisor [OPTIONS] <command>\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  install          Download and verify the proxy binary\n";
    std::cerr << "  start            Start the proxy and stay in the foreground\n";
    std::cerr << "  stop             Stop a running proxy\n";
    std::cerr << "  status           Show binary, process and URL information\n";
    std::cerr << "  auth <command>   Run a login/import command of the proxy binary\n";
    std::cerr << "  quota            Refresh quotas once and print them\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH    Path to config file (default: built-in defaults)\n";
    std::cerr << "  --port=N         Override the proxy port\n";
    std::cerr << "  --log-level=L    debug, info, warn, error or none\n";
    std::cerr << "  --help, -h       Show this help\n";
}

int exit_code_for(const Status &status) {
    if (status) {
        return 0;
    }
    if (status.code() == ErrorCode::PORT_CONFLICT) {
        return 2;
    }
    if (proxyvisor::common::is_security_failure(status.code())) {
        return 3;
    }
    return 1;
}

// Accepts "--name value" and "--name=value"
bool option_value(const std::string &arg, const std::string &name, int &i, int argc, char **argv,
                  std::string &value) {
    if (arg == name && i + 1 < argc) {
        value = argv[++i];
        return true;
    }
    if (arg.rfind(name + "=", 0) == 0) {
        value = arg.substr(name.size() + 1);
        return true;
    }
    return false;
}

int run_install(proxyvisor::runtime::AppContext &ctx) {
    auto status = ctx.proxy().install();
    if (!status) {
        std::cerr << "Install failed: " << status.message() << "\n";
        return exit_code_for(status);
    }
    std::cout << "Installed " << ctx.proxy().binary_path() << "\n";
    return 0;
}

int run_start(proxyvisor::runtime::AppContext &ctx) {
    auto &proxy = ctx.proxy();
    auto status = proxy.start();
    if (!status) {
        std::cerr << proxy.last_error() << "\n";
        return exit_code_for(status);
    }

    std::cout << "Proxy running at " << proxy.base_url() << "\n";
    ctx.quota_pipeline().refresh_all();
    ctx.warmup().restart();

    proxyvisor::runtime::SignalHandler::install();
    const auto health_interval = std::chrono::milliseconds(ctx.config().proxy.health_check_interval_ms);
    auto next_check = std::chrono::steady_clock::now() + health_interval;
    int exit_code = 0;

    while (!proxyvisor::runtime::SignalHandler::is_shutdown_requested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (std::chrono::steady_clock::now() < next_check) {
            continue;
        }
        next_check = std::chrono::steady_clock::now() + health_interval;

        if (auto crashed = proxy.poll_health()) {
            std::cerr << *crashed << "\n";
            exit_code = 1;
            break;
        }
        if (!proxy.check_responding()) {
            LOG_WARN("[Main] Management API is not responding");
        }
    }

    if (const int sig = proxyvisor::runtime::SignalHandler::last_signal()) {
        LOG_INFO("[Main] Received signal " << sig << ", shutting down");
    } else {
        LOG_INFO("[Main] Shutting down");
    }
    ctx.warmup().stop();
    proxy.stop();
    return exit_code;
}

int run_stop(proxyvisor::runtime::AppContext &ctx) {
    auto &proxy = ctx.proxy();
    if (!proxy.attach()) {
        std::cout << "Proxy is not running on port " << proxy.status().port << "\n";
        return 0;
    }
    proxy.stop();
    std::cout << "Proxy stopped\n";
    return 0;
}

int run_status(proxyvisor::runtime::AppContext &ctx) {
    auto &proxy = ctx.proxy();
    const bool responding = proxy.check_responding();
    std::cout << "Binary:     " << proxy.binary_path() << (proxy.is_binary_installed() ? "" : " (not installed)")
              << "\n";
    std::cout << "Config:     " << proxy.config_path() << "\n";
    std::cout << "Running:    " << (responding ? "yes" : "no") << "\n";
    std::cout << "Port:       " << proxy.status().port << "\n";
    std::cout << "Base URL:   " << proxy.base_url() << "\n";
    std::cout << "Management: " << proxy.management_url() << "\n";
    return 0;
}

int run_auth(proxyvisor::runtime::AppContext &ctx, const std::string &command) {
    proxyvisor::proxy::AuthCommandResult result;
    auto status = ctx.proxy().run_auth_command(command, result);
    if (!status) {
        std::cerr << status.message() << "\n";
        return exit_code_for(status);
    }
    if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }
    if (result.device_code) {
        std::cout << "Device code: " << *result.device_code << "\n";
    }
    return result.success ? 0 : 1;
}

int run_quota(proxyvisor::runtime::AppContext &ctx) {
    if (!ctx.proxy().attach()) {
        LOG_WARN("[Main] Proxy is not running; only local credentials are used");
    }

    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();
    if (!ctx.quota_pipeline().refresh_all([done] { done->set_value(); })) {
        std::cerr << "A quota refresh is already running\n";
        return 1;
    }
    if (finished.wait_for(std::chrono::minutes(2)) != std::future_status::ready) {
        std::cerr << "Quota refresh timed out\n";
        return 1;
    }

    auto snapshots = ctx.quota_store().snapshot_all();
    if (snapshots.empty()) {
        std::cout << "No quota data available\n";
        return 0;
    }
    for (const auto &entry : snapshots) {
        std::cout << proxyvisor::quota::provider_display_name(entry.first) << "\n";
        for (const auto &account : *entry.second) {
            std::cout << "  " << account.second.account_label(account.first);
            if (!account.second.plan_type.empty()) {
                std::cout << " [" << account.second.plan_type << "]";
            }
            std::cout << "\n";
            for (const auto &model : account.second.models) {
                std::cout << "    " << std::left << std::setw(28) << model.name;
                if (model.is_known()) {
                    std::cout << std::fixed << std::setprecision(1) << model.percentage << "%";
                } else {
                    std::cout << "unknown";
                }
                std::cout << "\n";
            }
        }
    }
    return 0;
}

}  // namespace

int main(int argc, char **argv) {
    std::string config_path;
    std::string port_override;
    std::string log_level;
    std::string command;
    std::string command_arg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (option_value(arg, "--config", i, argc, argv, value)) {
            config_path = value;
        } else if (option_value(arg, "--port", i, argc, argv, value)) {
            port_override = value;
        } else if (option_value(arg, "--log-level", i, argc, argv, value)) {
            log_level = value;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        } else if (command.empty()) {
            command = arg;
        } else if (command == "auth" && command_arg.empty()) {
            command_arg = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    if (command.empty()) {
        print_usage();
        return 1;
    }

    proxyvisor::runtime::AppConfig config;
    std::string error;

    if (!config_path.empty()) {
        if (!std::filesystem::exists(config_path)) {
            // Using cerr here as logger might not be configured yet
            std::cerr << "ERROR: Config file not found: " << config_path << "\n";
            return 1;
        }
        if (!proxyvisor::runtime::load_config(config_path, config, error)) {
            std::cerr << "ERROR: Failed to load config: " << error << "\n";
            return 1;
        }
    }

    if (!port_override.empty()) {
        try {
            config.proxy.port = std::stoi(port_override);
        } catch (const std::exception &) {
            std::cerr << "ERROR: Invalid port: " << port_override << "\n";
            return 1;
        }
    }
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    if (!proxyvisor::runtime::validate_config(config, error)) {
        std::cerr << "ERROR: Invalid configuration: " << error << "\n";
        return 1;
    }

    proxyvisor::logging::Logger::init(proxyvisor::logging::string_to_level(config.logging.level));

    proxyvisor::runtime::AppContext ctx(config);
    if (!ctx.init(error)) {
        LOG_ERROR("Initialization failed: " << error);
        return 1;
    }

    int exit_code = 1;
    if (command == "install") {
        exit_code = run_install(ctx);
    } else if (command == "start") {
        exit_code = run_start(ctx);
    } else if (command == "stop") {
        exit_code = run_stop(ctx);
    } else if (command == "status") {
        exit_code = run_status(ctx);
    } else if (command == "auth") {
        if (command_arg.empty()) {
            std::cerr << "auth requires a command\n";
        } else {
            exit_code = run_auth(ctx, command_arg);
        }
    } else if (command == "quota") {
        exit_code = run_quota(ctx);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
    }

    ctx.shutdown();
    return exit_code;
}

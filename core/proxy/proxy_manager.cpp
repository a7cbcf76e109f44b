#include "proxy_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>

#include "common/file_util.hpp"
#include "logging/logger.hpp"
#include "proxy/management_client.hpp"
#include "proxy/proxy_process.hpp"
#include "runtime/event_loop.hpp"
#include "runtime/worker_pool.hpp"

namespace proxyvisor {
namespace proxy {

namespace {

constexpr const char *kCancelledMessage = "Startup cancelled by user";

}  // namespace

const std::vector<std::string> &allowed_auth_commands() {
    static const std::vector<std::string> commands = {"copilot-login", "kiro-google-login", "kiro-aws-login",
                                                      "kiro-import"};
    return commands;
}

bool is_allowed_auth_command(const std::string &command) {
    const auto &allowed = allowed_auth_commands();
    return std::find(allowed.begin(), allowed.end(), command) != allowed.end();
}

std::optional<std::string> extract_device_code(const std::string &output) {
    static const std::regex pattern(R"(device[_-]?code[:\s]+([a-z0-9-]+))", std::regex::icase);
    std::smatch match;
    if (std::regex_search(output, match, pattern)) {
        return match[1].str();
    }
    return std::nullopt;
}

ProxyManager::ProxyManager(ProxyManagerOptions options, IReleaseSource &release_source, IPortInspector &ports,
                           notify::INotifier *notifier, ManagementApiFactory api_factory)
    : options_(std::move(options)),
      notifier_(notifier),
      api_factory_(std::move(api_factory)),
      installer_(release_source,
                 InstallerOptions{binary_path(), options_.asset_keyword, options_.min_binary_size}),
      supervisor_(ports, [this] { return check_responding(); }, options_.supervisor) {
    if (!api_factory_) {
        api_factory_ = [](int port, const std::string &key) -> std::shared_ptr<IManagementApi> {
            return std::make_shared<ManagementClient>(port, key);
        };
    }
    status_.port = options_.port;
}

// The supervisor terminates a self-spawned child on destruction; an adopted proxy keeps running
ProxyManager::~ProxyManager() = default;

common::Status ProxyManager::prepare() {
    auto status = common::ensure_directory(options_.data_dir, 0700);
    if (!status) {
        return status;
    }
    if (!std::filesystem::exists(options_.auth_dir)) {
        status = common::ensure_directory(options_.auth_dir, 0700);
        if (!status) {
            return status;
        }
    }

    std::string key;
    status = load_or_create_management_key(management_key_path(), key);
    if (!status) {
        return status;
    }

    ManagementConfig defaults;
    defaults.port = options_.port;
    defaults.auth_dir = options_.auth_dir;
    defaults.management_secret = key;
    try {
        defaults.api_keys.push_back("proxyvisor-local-" + common::generate_uuid4());
    } catch (const std::exception &e) {
        return common::Status::error(common::ErrorCode::IO_ERROR, std::string("Cannot generate API key: ") + e.what());
    }

    bool created = false;
    status = ensure_management_config(config_path(), defaults, created);
    if (!status) {
        return status;
    }

    int port = read_config_port(config_path()).value_or(options_.port);

    std::lock_guard<std::mutex> lock(mutex_);
    management_key_ = key;
    status_.port = port;
    management_api_ = api_factory_(port, key);
    LOG_DEBUG("[ProxyManager] Prepared " << options_.data_dir << " (port " << port << ")");
    return common::Status::ok();
}

common::Status ProxyManager::install() {
    auto status = installer_.install();
    if (!status) {
        set_last_error(status.message());
    }
    return status;
}

common::Status ProxyManager::start() {
    if (!management_api()) {
        auto prepared = prepare();
        if (!prepared) {
            set_last_error(prepared.message());
            return prepared;
        }
    }

    if (!is_binary_installed()) {
        LOG_INFO("[ProxyManager] Binary not installed, downloading");
        auto installed = install();
        if (!installed) {
            return installed;
        }
    }

    const bool was_running = status().running;
    set_last_error("");

    auto result = supervisor_.start(binary_path(), config_path(), status().port);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_.running = result.is_ok();
        if (!result) {
            last_error_ = result.message();
        }
    }

    if (result && !was_running) {
        notify("proxy_started", "Proxy Started", "Proxy is running on port " + std::to_string(status().port));
    }
    return result;
}

void ProxyManager::stop() {
    const bool was_running = status().running;
    supervisor_.stop();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_.running = false;
    }
    if (was_running) {
        LOG_INFO("[ProxyManager] Proxy stopped");
        notify("proxy_stopped", "Proxy Stopped", "Proxy has been stopped");
    }
}

void ProxyManager::cancel_startup() {
    const bool in_progress = installer_.is_installing() || supervisor_.snapshot().starting;
    installer_.cancel();
    supervisor_.cancel_startup();
    if (in_progress) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_.running = false;
        last_error_ = kCancelledMessage;
    }
}

void ProxyManager::install_async(runtime::WorkerPool &pool, runtime::EventLoop &loop, Completion done) {
    bool submitted = pool.submit([this, &loop, done] {
        auto status = install();
        loop.post([done, status] {
            if (done) done(status);
        });
    });
    if (!submitted) {
        loop.post([done] {
            if (done) done(common::Status::error(common::ErrorCode::PRECONDITION_FAILED, "Worker pool is not running"));
        });
    }
}

void ProxyManager::start_async(runtime::WorkerPool &pool, runtime::EventLoop &loop, Completion done) {
    bool submitted = pool.submit([this, &loop, done] {
        auto status = start();
        loop.post([done, status] {
            if (done) done(status);
        });
    });
    if (!submitted) {
        loop.post([done] {
            if (done) done(common::Status::error(common::ErrorCode::PRECONDITION_FAILED, "Worker pool is not running"));
        });
    }
}

bool ProxyManager::check_responding() {
    auto api = management_api();
    return api && api->check_responding();
}

bool ProxyManager::attach() {
    if (!management_api()) {
        auto prepared = prepare();
        if (!prepared) {
            set_last_error(prepared.message());
            return false;
        }
    }
    bool adopted = supervisor_.adopt_existing(status().port);
    std::lock_guard<std::mutex> lock(mutex_);
    status_.running = adopted;
    return adopted;
}

std::optional<std::string> ProxyManager::poll_health() {
    auto crashed = supervisor_.check_child_exit();
    if (!crashed) {
        return std::nullopt;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_.running = false;
        last_error_ = *crashed;
    }
    LOG_ERROR("[ProxyManager] " << *crashed);
    notify("proxy_crashed", "Proxy Crashed", *crashed);
    return crashed;
}

common::Status ProxyManager::set_port(int port) {
    if (port < 1024 || port > 65535) {
        return common::Status::error(common::ErrorCode::INVALID_ARGUMENT,
                                     "Port must be between 1024 and 65535, got " + std::to_string(port));
    }

    if (std::filesystem::exists(config_path())) {
        auto status = update_config_port(config_path(), port);
        if (!status) {
            return status;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (status_.running && status_.port != port) {
        LOG_WARN("[ProxyManager] Port change to " << port << " takes effect after restart");
    }
    status_.port = port;
    options_.port = port;
    if (!management_key_.empty()) {
        management_api_ = api_factory_(port, management_key_);
    }
    return common::Status::ok();
}

common::Status ProxyManager::run_auth_command(const std::string &command, AuthCommandResult &result) {
    result = AuthCommandResult{};

    if (!is_allowed_auth_command(command)) {
        std::string allowed;
        for (const auto &name : allowed_auth_commands()) {
            allowed += (allowed.empty() ? "" : ", ") + name;
        }
        result.message = "Invalid command. Allowed: " + allowed;
        return common::Status::error(common::ErrorCode::INVALID_ARGUMENT, result.message);
    }
    if (!is_binary_installed()) {
        result.message = "Binary not installed";
        return common::Status::error(common::ErrorCode::PRECONDITION_FAILED, result.message);
    }

    const std::string working_dir = std::filesystem::path(binary_path()).parent_path().string();
    ProxyProcess process("auth:" + command, binary_path(), {command}, working_dir, 200);
    if (!process.spawn()) {
        result.message = process.last_error();
        return common::Status::error(common::ErrorCode::SPAWN_FAILED, result.message);
    }

    if (!process.wait_for_exit(options_.auth_command_timeout_ms)) {
        process.terminate(2000);
        result.message = "Command timed out";
        LOG_WARN("[ProxyManager] Auth command '" << command << "' timed out");
        return common::Status::ok();
    }

    process.drain_output();
    const std::string out = process.stdout_tail();
    result.success = process.exit_code().value_or(-1) == 0;
    result.message = out.empty() ? process.stderr_tail() : out;
    if (result.success) {
        result.device_code = extract_device_code(out);
    }
    LOG_INFO("[ProxyManager] Auth command '" << command << "' " << (result.success ? "succeeded" : "failed"));
    return common::Status::ok();
}

ProxyStatus ProxyManager::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::string ProxyManager::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool ProxyManager::is_binary_installed() const { return installer_.is_installed(); }

bool ProxyManager::is_starting() const { return installer_.is_installing() || supervisor_.snapshot().starting; }

std::string ProxyManager::base_url() const { return "http://127.0.0.1:" + std::to_string(status().port); }

std::string ProxyManager::management_url() const { return base_url() + "/v0/management"; }

std::string ProxyManager::binary_path() const {
    return (std::filesystem::path(options_.data_dir) / options_.binary_name).string();
}

std::string ProxyManager::config_path() const {
    return (std::filesystem::path(options_.data_dir) / "config.yaml").string();
}

std::string ProxyManager::management_key_path() const {
    return (std::filesystem::path(options_.data_dir) / "management_key").string();
}

std::shared_ptr<IManagementApi> ProxyManager::management_api() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return management_api_;
}

void ProxyManager::set_last_error(const std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = error;
}

void ProxyManager::notify(const std::string &id, const std::string &title, const std::string &body) {
    if (notifier_ == nullptr) {
        return;
    }
    notifier_->notify(notify::Notification{id, title, body});
}

}  // namespace proxy
}  // namespace proxyvisor

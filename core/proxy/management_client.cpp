#include "management_client.hpp"

#include <httplib.h>

#include <nlohmann/json.hpp>

#include "logging/logger.hpp"

namespace proxyvisor {
namespace proxy {

namespace {

constexpr const char *kManagementPrefix = "/v0/management";

std::string json_string(const nlohmann::json &obj, const char *key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();  // auth_index is numeric on some proxy versions
}

bool json_bool(const nlohmann::json &obj, const char *key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

}  // namespace

std::string AuthFile::quota_lookup_key() const {
    if (!email.empty()) {
        return email;
    }
    if (!account.empty()) {
        return account;
    }
    std::string key = name;
    const std::string prefix = "github-copilot-";
    const std::string suffix = ".json";
    if (key.rfind(prefix, 0) == 0) {
        key = key.substr(prefix.size());
    }
    if (key.size() >= suffix.size() && key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
        key = key.substr(0, key.size() - suffix.size());
    }
    return key;
}

ManagementClient::ManagementClient(int port, std::string management_key, int probe_timeout_ms,
                                   int request_timeout_ms)
    : port_(port),
      management_key_(std::move(management_key)),
      probe_timeout_ms_(probe_timeout_ms),
      request_timeout_ms_(request_timeout_ms) {}

void ManagementClient::set_port(int port) {
    std::lock_guard<std::mutex> lock(mutex_);
    port_ = port;
}

int ManagementClient::port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return port_;
}

bool ManagementClient::check_responding() {
    httplib::Client client("127.0.0.1", port());
    client.set_connection_timeout(std::chrono::milliseconds(probe_timeout_ms_));
    client.set_read_timeout(std::chrono::milliseconds(probe_timeout_ms_));

    httplib::Headers headers = {{"Authorization", "Bearer " + management_key_}};
    auto result = client.Get(std::string(kManagementPrefix) + "/auth-files", headers);
    if (!result) {
        LOG_DEBUG("[Management] Probe failed: " << httplib::to_string(result.error()));
        return false;
    }
    if (result->status != 200) {
        LOG_DEBUG("[Management] Probe answered HTTP " << result->status);
        return false;
    }
    return true;
}

common::Status ManagementClient::list_auth_files(std::vector<AuthFile> &files) {
    httplib::Client client("127.0.0.1", port());
    client.set_connection_timeout(std::chrono::milliseconds(probe_timeout_ms_));
    client.set_read_timeout(std::chrono::milliseconds(request_timeout_ms_));

    httplib::Headers headers = {{"Authorization", "Bearer " + management_key_}};
    auto result = client.Get(std::string(kManagementPrefix) + "/auth-files", headers);
    if (!result) {
        return common::Status::error(common::ErrorCode::NETWORK_ERROR,
                                     "auth-files request failed: " + httplib::to_string(result.error()));
    }
    if (result->status != 200) {
        return common::Status::error(common::ErrorCode::NETWORK_ERROR,
                                     "auth-files returned HTTP " + std::to_string(result->status));
    }

    try {
        auto body = nlohmann::json::parse(result->body);
        files.clear();
        for (const auto &item : body.value("files", nlohmann::json::array())) {
            AuthFile file;
            file.id = json_string(item, "id");
            file.name = json_string(item, "name");
            file.provider = json_string(item, "provider");
            if (file.provider.empty()) {
                file.provider = json_string(item, "type");
            }
            file.status = json_string(item, "status");
            file.email = json_string(item, "email");
            file.account = json_string(item, "account");
            file.auth_index = json_string(item, "auth_index");
            file.disabled = json_bool(item, "disabled");
            file.unavailable = json_bool(item, "unavailable");
            files.push_back(std::move(file));
        }
    } catch (const nlohmann::json::exception &e) {
        return common::Status::error(common::ErrorCode::NETWORK_ERROR,
                                     std::string("auth-files returned malformed JSON: ") + e.what());
    }
    return common::Status::ok();
}

common::Status ManagementClient::list_auth_file_models(const std::string &auth_name,
                                                       std::vector<std::string> &models) {
    httplib::Client client("127.0.0.1", port());
    client.set_connection_timeout(std::chrono::milliseconds(probe_timeout_ms_));
    client.set_read_timeout(std::chrono::milliseconds(request_timeout_ms_));

    httplib::Headers headers = {{"Authorization", "Bearer " + management_key_}};
    httplib::Params params = {{"name", auth_name}};
    auto result = client.Get(std::string(kManagementPrefix) + "/auth-files/models", params, headers);
    if (!result) {
        return common::Status::error(common::ErrorCode::NETWORK_ERROR,
                                     "auth-files/models request failed: " + httplib::to_string(result.error()));
    }
    if (result->status != 200) {
        return common::Status::error(common::ErrorCode::NETWORK_ERROR,
                                     "auth-files/models returned HTTP " + std::to_string(result->status));
    }

    try {
        auto body = nlohmann::json::parse(result->body);
        models.clear();
        for (const auto &item : body.value("models", nlohmann::json::array())) {
            if (item.is_string()) {
                models.push_back(item.get<std::string>());
            } else if (item.is_object() && item.contains("id")) {
                models.push_back(json_string(item, "id"));
            }
        }
    } catch (const nlohmann::json::exception &e) {
        return common::Status::error(common::ErrorCode::NETWORK_ERROR,
                                     std::string("auth-files/models returned malformed JSON: ") + e.what());
    }
    return common::Status::ok();
}

common::Status ManagementClient::api_call(const ApiCallRequest &request, ApiCallResponse &response) {
    httplib::Client client("127.0.0.1", port());
    client.set_connection_timeout(std::chrono::milliseconds(probe_timeout_ms_));
    client.set_read_timeout(std::chrono::milliseconds(request_timeout_ms_));

    nlohmann::json payload = {{"auth_index", request.auth_index},
                              {"method", request.method},
                              {"url", request.url},
                              {"header", request.headers},
                              {"data", request.data}};

    httplib::Headers headers = {{"Authorization", "Bearer " + management_key_}};
    auto result =
        client.Post(std::string(kManagementPrefix) + "/api-call", headers, payload.dump(), "application/json");
    if (!result) {
        return common::Status::error(common::ErrorCode::NETWORK_ERROR,
                                     "api-call request failed: " + httplib::to_string(result.error()));
    }
    if (result->status != 200) {
        return common::Status::error(common::ErrorCode::NETWORK_ERROR,
                                     "api-call returned HTTP " + std::to_string(result->status));
    }

    try {
        auto body = nlohmann::json::parse(result->body);
        response.status_code = body.value("status_code", 0);
        auto it = body.find("body");
        if (it == body.end() || it->is_null()) {
            response.body.clear();
        } else {
            response.body = it->is_string() ? it->get<std::string>() : it->dump();
        }
    } catch (const nlohmann::json::exception &e) {
        return common::Status::error(common::ErrorCode::NETWORK_ERROR,
                                     std::string("api-call returned malformed JSON: ") + e.what());
    }
    return common::Status::ok();
}

}  // namespace proxy
}  // namespace proxyvisor

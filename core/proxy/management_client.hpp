#pragma once

#include <mutex>
#include <string>

#include "proxy/management_api.hpp"

namespace proxyvisor {
namespace proxy {

/**
 * @brief cpp-httplib client for the proxy's /v0/management endpoints
 *
 * Talks plain HTTP to 127.0.0.1 only. A fresh httplib::Client is created per
 * request so calls from different worker threads never share a connection.
 */
class ManagementClient : public IManagementApi {
public:
    ManagementClient(int port, std::string management_key, int probe_timeout_ms = 5000,
                     int request_timeout_ms = 30000);

    void set_port(int port);
    int port() const;

    bool check_responding() override;
    common::Status list_auth_files(std::vector<AuthFile> &files) override;
    common::Status list_auth_file_models(const std::string &auth_name, std::vector<std::string> &models) override;
    common::Status api_call(const ApiCallRequest &request, ApiCallResponse &response) override;

private:
    mutable std::mutex mutex_;
    int port_;
    std::string management_key_;
    int probe_timeout_ms_;
    int request_timeout_ms_;
};

}  // namespace proxy
}  // namespace proxyvisor

#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/status.hpp"

namespace proxyvisor {
namespace proxy {

// Credential file as reported by GET /auth-files
struct AuthFile {
    std::string id;
    std::string name;
    std::string provider;
    std::string status;
    std::string email;
    std::string account;
    std::string auth_index;
    bool disabled = false;
    bool unavailable = false;

    // email, else account, else the file name stripped of "github-copilot-" and ".json"
    std::string quota_lookup_key() const;
};

// Upstream request relayed by the proxy with the account's credentials
struct ApiCallRequest {
    std::string auth_index;
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string data;
};

struct ApiCallResponse {
    int status_code = 0;
    std::string body;
};

// Authenticated view of the running proxy's management API
class IManagementApi {
public:
    virtual ~IManagementApi() = default;

    // GET /auth-files answers 200 with our management key
    virtual bool check_responding() = 0;

    virtual common::Status list_auth_files(std::vector<AuthFile> &files) = 0;

    // Model ids available to one credential file
    virtual common::Status list_auth_file_models(const std::string &auth_name, std::vector<std::string> &models) = 0;

    virtual common::Status api_call(const ApiCallRequest &request, ApiCallResponse &response) = 0;
};

}  // namespace proxy
}  // namespace proxyvisor

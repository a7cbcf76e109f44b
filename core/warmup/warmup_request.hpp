#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "proxy/management_api.hpp"

namespace proxyvisor {
namespace warmup {

// Selected model id -> upstream Antigravity model name (case-insensitive lookup)
std::string map_model_alias(const std::string &model);

// Upstream base URLs, tried in order
const std::vector<std::string> &warmup_endpoints();

// Minimal one-token generateContent request
nlohmann::json build_warmup_payload(const std::string &upstream_model);

struct AuthMatch {
    std::string auth_index;
    std::string file_name;
};

// Antigravity credential file for an account key, comparing email, account,
// quota lookup key and file name after normalize_account_key()
std::optional<AuthMatch> match_auth_file(const std::vector<proxy::AuthFile> &files, const std::string &account_key);

// One warmup request relayed through the proxy's api-call endpoint.
// Succeeds on the first endpoint answering 2xx.
common::Status send_warmup(proxy::IManagementApi &api, const std::string &auth_index, const std::string &model);

}  // namespace warmup
}  // namespace proxyvisor

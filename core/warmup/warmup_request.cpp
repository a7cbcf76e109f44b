#include "warmup_request.hpp"

#include <algorithm>
#include <cctype>
#include <map>

#include "common/file_util.hpp"
#include "logging/logger.hpp"
#include "warmup/warmup_types.hpp"

namespace proxyvisor {
namespace warmup {

namespace {

constexpr const char *kGeneratePath = "/v1internal:generateContent";
constexpr const char *kUserAgent = "antigravity/1.104.0";

std::string trim(const std::string &s) {
    const size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

}  // namespace

std::string map_model_alias(const std::string &model) {
    static const std::map<std::string, std::string> aliases = {
        {"gemini-3-pro-preview", "gemini-3-pro-high"},
        {"gemini-3-flash-preview", "gemini-3-flash"},
        {"gemini-2.5-flash-preview", "gemini-2.5-flash"},
        {"gemini-2.5-flash-lite-preview", "gemini-2.5-flash-lite"},
        {"gemini-2.5-pro-preview", "gemini-2.5-pro"},
        {"gemini-claude-sonnet-4-5", "claude-sonnet-4-5"},
        {"gemini-claude-sonnet-4-5-thinking", "claude-sonnet-4-5-thinking"},
        {"gemini-claude-opus-4-5-thinking", "claude-opus-4-5-thinking"},
        {"gemini-2.5-computer-use-preview-10-2025", "rev19-uic3-1p"},
        {"gemini-3-pro-image-preview", "gemini-3-pro-image"},
    };

    std::string lowered = model;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = aliases.find(lowered);
    return it == aliases.end() ? model : it->second;
}

const std::vector<std::string> &warmup_endpoints() {
    static const std::vector<std::string> endpoints = {
        "https://daily-cloudcode-pa.googleapis.com",
        "https://daily-cloudcode-pa.sandbox.googleapis.com",
        "https://cloudcode-pa.googleapis.com",
    };
    return endpoints;
}

nlohmann::json build_warmup_payload(const std::string &upstream_model) {
    const std::string project_uuid = common::generate_uuid4();
    const std::string session_uuid = common::generate_uuid4();

    nlohmann::json payload;
    payload["project"] = "warmup-" + project_uuid.substr(0, 5);
    payload["requestId"] = "agent-" + common::generate_uuid4();
    payload["userAgent"] = "antigravity";
    payload["model"] = upstream_model;

    nlohmann::json part = {{"text", "."}};
    nlohmann::json content = {{"role", "user"}, {"parts", nlohmann::json::array({part})}};
    payload["request"] = {
        {"sessionId", "-" + session_uuid.substr(0, 12)},
        {"contents", nlohmann::json::array({content})},
        {"generationConfig", {{"maxOutputTokens", 1}}},
    };
    return payload;
}

std::optional<AuthMatch> match_auth_file(const std::vector<proxy::AuthFile> &files, const std::string &account_key) {
    const std::string wanted = normalize_account_key(account_key);

    for (const auto &file : files) {
        if (file.provider != "antigravity") {
            continue;
        }
        const std::string name = trim(file.name);
        const std::string index = file.auth_index.empty() ? file.id : file.auth_index;
        if (name.empty() || index.empty()) {
            continue;
        }

        const std::string candidates[] = {file.email, file.account, file.quota_lookup_key(), name};
        for (const auto &candidate : candidates) {
            if (!candidate.empty() && normalize_account_key(candidate) == wanted) {
                return AuthMatch{index, name};
            }
        }
    }
    return std::nullopt;
}

common::Status send_warmup(proxy::IManagementApi &api, const std::string &auth_index, const std::string &model) {
    proxy::ApiCallRequest request;
    request.auth_index = auth_index;
    request.method = "POST";
    request.headers = {{"Authorization", "Bearer $TOKEN$"},
                       {"Content-Type", "application/json"},
                       {"User-Agent", kUserAgent}};
    try {
        request.data = build_warmup_payload(map_model_alias(model)).dump();
    } catch (const std::exception &e) {
        return common::Status::error(common::ErrorCode::IO_ERROR, std::string("Warmup failed: ") + e.what());
    }

    std::string last_error = "Invalid response";
    for (const auto &base : warmup_endpoints()) {
        request.url = base + kGeneratePath;
        proxy::ApiCallResponse response;
        auto status = api.api_call(request, response);
        if (!status) {
            last_error = status.message();
            continue;
        }
        if (response.status_code >= 200 && response.status_code < 300) {
            LOG_DEBUG("[Warmup] " << model << " warmed via " << base);
            return common::Status::ok();
        }
        last_error = "HTTP " + std::to_string(response.status_code) + ": " + response.body.substr(0, 200);
    }
    return common::Status::error(common::ErrorCode::NETWORK_ERROR, "Warmup failed: " + last_error);
}

}  // namespace warmup
}  // namespace proxyvisor

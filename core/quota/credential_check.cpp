#include "credential_check.hpp"

#include <openssl/evp.h>

#include <vector>

namespace proxyvisor {
namespace quota {

namespace {

constexpr size_t kApiKeyMinLength = 20;
constexpr const char *kAuthClaim = "https://api.openai.com/auth";

std::string string_field(const nlohmann::json &obj, const char *key) {
    if (!obj.is_object()) {
        return "";
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

// Top-level field first, then the same field under "tokens"
std::string token_field(const nlohmann::json &auth, const char *key) {
    std::string value = string_field(auth, key);
    if (value.empty() && auth.is_object() && auth.contains("tokens")) {
        value = string_field(auth["tokens"], key);
    }
    return value;
}

bool is_openai_api_key(const std::string &key) { return key.rfind("sk-", 0) == 0 && key.size() > kApiKeyMinLength; }

}  // namespace

CredentialValidity validate_codex_credential(const nlohmann::json &auth) {
    CredentialValidity validity;
    if (!auth.is_object()) {
        validity.reason = "Auth file is not a JSON object";
        return validity;
    }

    if (!token_field(auth, "access_token").empty()) {
        validity.valid_for_config = true;
        validity.valid_for_quota = true;
        validity.reason = "OAuth access token";
        return validity;
    }

    const std::string api_key = string_field(auth, "OPENAI_API_KEY");
    if (is_openai_api_key(api_key)) {
        validity.valid_for_config = true;
        validity.reason = "OpenAI API keys cannot be used for quota fetching";
        return validity;
    }
    if (!api_key.empty()) {
        validity.valid_for_config = true;
        validity.valid_for_quota = true;
        validity.reason = "Bearer token";
        return validity;
    }

    validity.reason = "No access token or API key";
    return validity;
}

std::optional<std::string> codex_access_token(const nlohmann::json &auth) {
    if (!validate_codex_credential(auth).valid_for_quota) {
        return std::nullopt;
    }
    std::string token = token_field(auth, "access_token");
    if (token.empty()) {
        token = string_field(auth, "OPENAI_API_KEY");
    }
    return token;
}

std::optional<std::string> codex_account_id(const nlohmann::json &auth) {
    std::string account_id = token_field(auth, "account_id");
    if (!account_id.empty()) {
        return account_id;
    }

    const std::string id_token = token_field(auth, "id_token");
    if (id_token.empty()) {
        return std::nullopt;
    }
    auto claims = decode_jwt_claims(id_token);
    if (!claims.is_object() || !claims.contains(kAuthClaim)) {
        return std::nullopt;
    }
    account_id = string_field(claims[kAuthClaim], "chatgpt_account_id");
    if (account_id.empty()) {
        return std::nullopt;
    }
    return account_id;
}

nlohmann::json decode_jwt_claims(const std::string &token) {
    const size_t first = token.find('.');
    if (first == std::string::npos) {
        return nullptr;
    }
    const size_t second = token.find('.', first + 1);
    std::string payload =
        token.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
    if (payload.empty()) {
        return nullptr;
    }

    for (char &c : payload) {
        if (c == '-') c = '+';
        if (c == '_') c = '/';
    }
    size_t padding = 0;
    while (payload.size() % 4 != 0) {
        payload.push_back('=');
        ++padding;
    }

    std::vector<unsigned char> decoded(payload.size() / 4 * 3 + 1);
    int len = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char *>(payload.data()),
                              static_cast<int>(payload.size()));
    if (len < 0) {
        return nullptr;
    }
    // EVP_DecodeBlock counts padding bytes as output
    std::string json_text(reinterpret_cast<const char *>(decoded.data()), static_cast<size_t>(len));
    if (padding > 0 && json_text.size() >= padding) {
        json_text.resize(json_text.size() - padding);
    }

    auto claims = nlohmann::json::parse(json_text, nullptr, false);
    if (claims.is_discarded()) {
        return nullptr;
    }
    return claims;
}

}  // namespace quota
}  // namespace proxyvisor

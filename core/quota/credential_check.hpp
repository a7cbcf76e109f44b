#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace proxyvisor {
namespace quota {

// Two tiers: a credential may be usable by the proxy but not for quota lookups
struct CredentialValidity {
    bool valid_for_config = false;
    bool valid_for_quota = false;
    std::string reason;
};

// Codex auth document, either the proxy's flat form ({access_token, id_token,
// account_id, email}) or the Codex CLI form ({OPENAI_API_KEY, tokens: {...}}).
CredentialValidity validate_codex_credential(const nlohmann::json &auth);

// OAuth access token, or a non-"sk-" key usable as one
std::optional<std::string> codex_access_token(const nlohmann::json &auth);

// account_id field, else the chatgpt_account_id claim of id_token
std::optional<std::string> codex_account_id(const nlohmann::json &auth);

// Payload of a JWT (base64url, unverified). Null json on malformed input.
nlohmann::json decode_jwt_claims(const std::string &token);

}  // namespace quota
}  // namespace proxyvisor

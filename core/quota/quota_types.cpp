#include "quota_types.hpp"

#include <cmath>

namespace proxyvisor {
namespace quota {

const std::vector<Provider> &all_providers() {
    static const std::vector<Provider> providers = {Provider::GEMINI_CLI, Provider::CLAUDE,  Provider::CODEX,
                                                     Provider::QWEN,       Provider::IFLOW,   Provider::ANTIGRAVITY,
                                                     Provider::VERTEX,     Provider::KIRO,    Provider::GITHUB_COPILOT,
                                                     Provider::CURSOR,     Provider::TRAE,    Provider::GLM,
                                                     Provider::WARP};
    return providers;
}

const char *provider_to_string(Provider provider) {
    switch (provider) {
        case Provider::GEMINI_CLI:
            return "gemini-cli";
        case Provider::CLAUDE:
            return "claude";
        case Provider::CODEX:
            return "codex";
        case Provider::QWEN:
            return "qwen";
        case Provider::IFLOW:
            return "iflow";
        case Provider::ANTIGRAVITY:
            return "antigravity";
        case Provider::VERTEX:
            return "vertex";
        case Provider::KIRO:
            return "kiro";
        case Provider::GITHUB_COPILOT:
            return "github-copilot";
        case Provider::CURSOR:
            return "cursor";
        case Provider::TRAE:
            return "trae";
        case Provider::GLM:
            return "glm";
        case Provider::WARP:
            return "warp";
    }
    return "unknown";
}

const char *provider_display_name(Provider provider) {
    switch (provider) {
        case Provider::GEMINI_CLI:
            return "Gemini CLI";
        case Provider::CLAUDE:
            return "Claude Code";
        case Provider::CODEX:
            return "Codex (OpenAI)";
        case Provider::QWEN:
            return "Qwen Code";
        case Provider::IFLOW:
            return "iFlow";
        case Provider::ANTIGRAVITY:
            return "Antigravity";
        case Provider::VERTEX:
            return "Vertex AI";
        case Provider::KIRO:
            return "Kiro (CodeWhisperer)";
        case Provider::GITHUB_COPILOT:
            return "GitHub Copilot";
        case Provider::CURSOR:
            return "Cursor";
        case Provider::TRAE:
            return "Trae";
        case Provider::GLM:
            return "GLM";
        case Provider::WARP:
            return "Warp";
    }
    return "Unknown";
}

std::optional<Provider> provider_from_string(const std::string &id) {
    if (id == "copilot") {
        return Provider::GITHUB_COPILOT;
    }
    for (Provider provider : all_providers()) {
        if (id == provider_to_string(provider)) {
            return provider;
        }
    }
    return std::nullopt;
}

bool is_privacy_gated(Provider provider) { return provider == Provider::CURSOR || provider == Provider::TRAE; }

double clamp_percentage(double percentage) {
    if (std::isnan(percentage) || percentage < 0.0) {
        return kUnknownPercentage;
    }
    if (percentage > 100.0) {
        return 100.0;
    }
    return percentage;
}

void ProviderQuotaData::add_model(ModelQuota model) {
    model.percentage = clamp_percentage(model.percentage);
    models.push_back(std::move(model));
}

std::string ProviderQuotaData::account_label(const std::string &account_key) const {
    if (!account_email.empty()) {
        return account_email;
    }
    if (!account_name.empty()) {
        return account_name;
    }
    return account_key;
}

}  // namespace quota
}  // namespace proxyvisor

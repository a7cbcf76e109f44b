#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace proxyvisor {
namespace quota {

enum class Provider {
    GEMINI_CLI,
    CLAUDE,
    CODEX,
    QWEN,
    IFLOW,
    ANTIGRAVITY,
    VERTEX,
    KIRO,
    GITHUB_COPILOT,
    CURSOR,
    TRAE,
    GLM,
    WARP
};

const std::vector<Provider> &all_providers();

// Wire id as used by the proxy ("gemini-cli", "github-copilot", ...)
const char *provider_to_string(Provider provider);
const char *provider_display_name(Provider provider);

// Accepts wire ids plus the "copilot" alias
std::optional<Provider> provider_from_string(const std::string &id);

// Providers that inspect local IDE state and only refresh on explicit scan
bool is_privacy_gated(Provider provider);

// Percentage value meaning "unknown", never 0
constexpr double kUnknownPercentage = -1.0;

// Map into [-1, 100]; any negative or NaN value becomes the unknown sentinel
double clamp_percentage(double percentage);

struct ModelQuota {
    std::string name;
    double percentage = kUnknownPercentage;  // Remaining, 0-100
    std::optional<int64_t> used;
    std::optional<int64_t> limit;
    std::optional<int64_t> remaining;
    std::optional<std::string> reset_time;  // ISO-8601

    bool is_known() const { return percentage >= 0.0; }
};

struct ProviderQuotaData {
    std::vector<ModelQuota> models;
    std::string account_email;
    std::string account_name;
    std::string plan_type;
    std::string subscription_status;
    std::string organization_name;
    std::chrono::system_clock::time_point last_updated = std::chrono::system_clock::now();

    // Appends with the percentage clamped
    void add_model(ModelQuota model);

    // Email, else name, else the given key
    std::string account_label(const std::string &account_key) const;
};

// accountKey -> quota data, for one provider
using AccountQuotaMap = std::map<std::string, ProviderQuotaData>;

}  // namespace quota
}  // namespace proxyvisor

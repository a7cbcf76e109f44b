#pragma once

#include <filesystem>
#include <string>

#include "quota/quota_fetcher.hpp"

namespace proxyvisor {
namespace quota {

// Map a wham/usage response into ProviderQuotaData. Returns false on malformed JSON.
bool parse_codex_usage(const std::string &body, ProviderQuotaData &data, std::string &error);

/**
 * @brief Codex (ChatGPT) quota from the usage endpoint
 *
 * Reads every *codex*.json credential in the auth directory, skipping files
 * whose credential is not valid for quota lookups (OpenAI API keys).
 */
class CodexQuotaFetcher : public IQuotaFetcher {
public:
    explicit CodexQuotaFetcher(std::string auth_dir, std::string usage_origin = "https://chatgpt.com",
                               int timeout_ms = 15000);

    Provider provider() const override { return Provider::CODEX; }

    AccountQuotaMap fetch_all_quotas(proxy::IManagementApi *api) override;

private:
    // Adds the usage behind one auth file to accounts. May throw nlohmann::json::exception
    void fetch_account(const std::filesystem::path &path, AccountQuotaMap &accounts);
    bool fetch_usage(const std::string &token, const std::string &account_id, ProviderQuotaData &data);

    std::string auth_dir_;
    std::string usage_origin_;
    int timeout_ms_;
};

}  // namespace quota
}  // namespace proxyvisor

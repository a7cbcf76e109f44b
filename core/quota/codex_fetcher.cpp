#include "codex_fetcher.hpp"

#include <httplib.h>

#include <ctime>
#include <filesystem>
#include <nlohmann/json.hpp>

#include "common/file_util.hpp"
#include "logging/logger.hpp"
#include "quota/credential_check.hpp"

namespace proxyvisor {
namespace quota {

namespace {

constexpr const char *kUsagePath = "/backend-api/wham/usage";

// Remaining percentage of a {used_percent, reset_at} window; false if absent
bool window_remaining(const nlohmann::json &parent, const char *key, ModelQuota &model) {
    auto it = parent.find(key);
    if (it == parent.end() || !it->is_object() || it->empty()) {
        return false;
    }
    auto used = it->find("used_percent");
    if (used == it->end()) {
        model.percentage = 100.0;
    } else if (used->is_number()) {
        model.percentage = 100.0 - used->get<double>();
    } else {
        model.percentage = kUnknownPercentage;
    }
    if (it->contains("reset_at") && (*it)["reset_at"].is_number()) {
        std::time_t reset = (*it)["reset_at"].get<std::time_t>();
        std::tm tm_utc{};
        gmtime_r(&reset, &tm_utc);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
        model.reset_time = std::string(buf);
    }
    return true;
}

bool flag(const nlohmann::json &object, const char *key) {
    auto it = object.find(key);
    return it != object.end() && it->is_boolean() && it->get<bool>();
}

}  // namespace

bool parse_codex_usage(const std::string &body, ProviderQuotaData &data, std::string &error) {
    auto root = nlohmann::json::parse(body, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        error = "Usage response is not a JSON object";
        return false;
    }

    if (root.contains("plan_type") && root["plan_type"].is_string()) {
        data.plan_type = root["plan_type"].get<std::string>();
    }

    if (root.contains("rate_limit") && root["rate_limit"].is_object()) {
        const auto &rate_limit = root["rate_limit"];
        ModelQuota session{"codex-session"};
        if (window_remaining(rate_limit, "primary_window", session)) {
            data.add_model(session);
        }
        ModelQuota weekly{"codex-weekly"};
        if (window_remaining(rate_limit, "secondary_window", weekly)) {
            data.add_model(weekly);
        }
    }

    if (root.contains("code_review_rate_limit") && root["code_review_rate_limit"].is_object()) {
        ModelQuota review{"codex-code-review"};
        if (window_remaining(root["code_review_rate_limit"], "primary_window", review)) {
            data.add_model(review);
        }
    }

    if (root.contains("credits") && root["credits"].is_object()) {
        const auto &credits = root["credits"];
        ModelQuota model{"codex-credits"};
        if (flag(credits, "unlimited")) {
            model.percentage = 100.0;
        } else if (credits.contains("balance") && credits["balance"].is_number()) {
            model.remaining = static_cast<int64_t>(credits["balance"].get<double>());
            model.percentage = flag(credits, "has_credits") ? 100.0 : 0.0;
        }
        data.add_model(model);
    }
    return true;
}

CodexQuotaFetcher::CodexQuotaFetcher(std::string auth_dir, std::string usage_origin, int timeout_ms)
    : auth_dir_(std::move(auth_dir)), usage_origin_(std::move(usage_origin)), timeout_ms_(timeout_ms) {}

AccountQuotaMap CodexQuotaFetcher::fetch_all_quotas(proxy::IManagementApi * /*api*/) {
    AccountQuotaMap accounts;

    std::error_code ec;
    std::filesystem::directory_iterator it(auth_dir_, ec);
    if (ec) {
        LOG_DEBUG("[Codex] Auth dir not readable: " << auth_dir_);
        return accounts;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const std::string name = it->path().filename().string();
        if (name.find("codex") == std::string::npos || it->path().extension() != ".json") {
            continue;
        }

        try {
            fetch_account(it->path(), accounts);
        } catch (const nlohmann::json::exception &e) {
            LOG_WARN("[Codex] Skipping " << name << ": " << e.what());
        }
    }
    return accounts;
}

void CodexQuotaFetcher::fetch_account(const std::filesystem::path &path, AccountQuotaMap &accounts) {
    const std::string name = path.filename().string();

    std::string contents;
    if (!common::read_file(path.string(), contents)) {
        return;
    }
    auto auth = nlohmann::json::parse(contents, nullptr, false);
    if (auth.is_discarded()) {
        LOG_WARN("[Codex] Ignoring malformed auth file " << name);
        return;
    }

    auto validity = validate_codex_credential(auth);
    if (!validity.valid_for_quota) {
        LOG_INFO("[Codex] Skipping " << name << ": " << validity.reason);
        return;
    }

    ProviderQuotaData data;
    if (auth.contains("email") && auth["email"].is_string()) {
        data.account_email = auth["email"].get<std::string>();
    }
    if (!fetch_usage(*codex_access_token(auth), codex_account_id(auth).value_or(""), data)) {
        return;
    }
    const std::string key = data.account_email.empty() ? path.stem().string() : data.account_email;
    accounts[key] = std::move(data);
}

bool CodexQuotaFetcher::fetch_usage(const std::string &token, const std::string &account_id,
                                    ProviderQuotaData &data) {
    httplib::Client client(usage_origin_);
    client.enable_server_certificate_verification(true);
    client.set_connection_timeout(std::chrono::milliseconds(timeout_ms_));
    client.set_read_timeout(std::chrono::milliseconds(timeout_ms_));

    httplib::Headers headers = {{"Authorization", "Bearer " + token}, {"Accept", "application/json"}};
    if (!account_id.empty()) {
        headers.emplace("ChatGPT-Account-Id", account_id);
    }

    auto result = client.Get(kUsagePath, headers);
    if (!result) {
        LOG_WARN("[Codex] Usage request failed: " << httplib::to_string(result.error()));
        return false;
    }
    if (result->status != 200) {
        LOG_WARN("[Codex] Usage API returned HTTP " << result->status);
        return false;
    }

    std::string error;
    if (!parse_codex_usage(result->body, data, error)) {
        LOG_WARN("[Codex] " << error);
        return false;
    }
    return true;
}

}  // namespace quota
}  // namespace proxyvisor

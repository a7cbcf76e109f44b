#include "release_source.hpp"

#include <httplib.h>

#include <nlohmann/json.hpp>

#include "logging/logger.hpp"

namespace proxyvisor {
namespace proxy {

namespace {

constexpr const char *kUserAgent = "proxyvisor";
constexpr size_t kMaxDownloadBytes = 512 * 1024 * 1024;

}  // namespace

bool parse_release_json(const std::string &json_text, ReleaseInfo &release, std::string &error) {
    try {
        auto body = nlohmann::json::parse(json_text);
        if (!body.is_object()) {
            error = "Release metadata is not a JSON object";
            return false;
        }
        release.tag_name = body.value("tag_name", "");
        auto notes = body.find("body");
        release.body = (notes != body.end() && notes->is_string()) ? notes->get<std::string>() : "";
        release.assets.clear();
        for (const auto &asset : body.value("assets", nlohmann::json::array())) {
            ReleaseAsset parsed;
            parsed.name = asset.value("name", "");
            parsed.download_url = asset.value("browser_download_url", "");
            if (parsed.name.empty() || parsed.download_url.empty()) {
                continue;
            }
            release.assets.push_back(std::move(parsed));
        }
        return true;
    } catch (const nlohmann::json::exception &e) {
        error = std::string("Malformed release metadata: ") + e.what();
        return false;
    }
}

bool split_url(const std::string &url, std::string &origin, std::string &path) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return false;
    }
    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        origin = url;
        path = "/";
    } else {
        origin = url.substr(0, path_start);
        path = url.substr(path_start);
    }
    return origin.size() > scheme_end + 3;
}

GithubReleaseSource::GithubReleaseSource(std::string api_url, std::string repo, int timeout_ms)
    : api_url_(std::move(api_url)), repo_(std::move(repo)), timeout_ms_(timeout_ms) {}

common::Status GithubReleaseSource::fetch_latest(ReleaseInfo &release) {
    httplib::Client client(api_url_);
    client.enable_server_certificate_verification(true);
    client.set_follow_location(true);
    client.set_connection_timeout(std::chrono::milliseconds(timeout_ms_));
    client.set_read_timeout(std::chrono::milliseconds(timeout_ms_));

    httplib::Headers headers = {{"Accept", "application/vnd.github+json"}, {"User-Agent", kUserAgent}};
    const std::string path = "/repos/" + repo_ + "/releases/latest";
    LOG_INFO("[Release] Fetching " << api_url_ << path);

    auto result = client.Get(path, headers);
    if (!result) {
        return common::Status::error(common::ErrorCode::NETWORK_ERROR,
                                     "Release request failed: " + httplib::to_string(result.error()));
    }
    if (result->status != 200) {
        return common::Status::error(common::ErrorCode::NETWORK_ERROR,
                                     "Release API returned HTTP " + std::to_string(result->status));
    }

    std::string error;
    if (!parse_release_json(result->body, release, error)) {
        return common::Status::error(common::ErrorCode::NETWORK_ERROR, error);
    }
    LOG_INFO("[Release] Latest is " << (release.tag_name.empty() ? "<untagged>" : release.tag_name) << " with "
                                    << release.assets.size() << " asset(s)");
    return common::Status::ok();
}

common::Status GithubReleaseSource::download(const std::string &url, std::string &bytes,
                                             const std::atomic<bool> *cancel) {
    std::string origin;
    std::string path;
    if (!split_url(url, origin, path)) {
        return common::Status::error(common::ErrorCode::INVALID_ARGUMENT, "Malformed download URL: " + url);
    }
    if (origin.rfind("https://", 0) != 0) {
        return common::Status::error(common::ErrorCode::INVALID_ARGUMENT, "Refusing non-TLS download: " + url);
    }

    httplib::Client client(origin);
    client.enable_server_certificate_verification(true);
    client.set_follow_location(true);
    client.set_connection_timeout(std::chrono::milliseconds(timeout_ms_));
    client.set_read_timeout(std::chrono::milliseconds(timeout_ms_));

    httplib::Headers headers = {{"Accept", "application/octet-stream"}, {"User-Agent", kUserAgent}};

    bytes.clear();
    bool too_large = false;
    auto result = client.Get(path, headers, [&](const char *data, size_t length) {
        if (cancel != nullptr && cancel->load()) {
            return false;
        }
        if (bytes.size() + length > kMaxDownloadBytes) {
            too_large = true;
            return false;
        }
        bytes.append(data, length);
        return true;
    });

    if (cancel != nullptr && cancel->load()) {
        bytes.clear();
        return common::Status::error(common::ErrorCode::CANCELLED, "Download cancelled");
    }
    if (too_large) {
        bytes.clear();
        return common::Status::error(common::ErrorCode::NETWORK_ERROR, "Download exceeds size limit: " + url);
    }
    if (!result) {
        bytes.clear();
        return common::Status::error(common::ErrorCode::NETWORK_ERROR,
                                     "Download failed: " + httplib::to_string(result.error()));
    }
    if (result->status != 200) {
        bytes.clear();
        return common::Status::error(common::ErrorCode::NETWORK_ERROR,
                                     "Download returned HTTP " + std::to_string(result->status));
    }
    LOG_DEBUG("[Release] Downloaded " << bytes.size() << " bytes from " << url);
    return common::Status::ok();
}

}  // namespace proxy
}  // namespace proxyvisor

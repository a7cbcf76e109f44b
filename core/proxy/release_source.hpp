#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "common/status.hpp"

namespace proxyvisor {
namespace proxy {

struct ReleaseAsset {
    std::string name;
    std::string download_url;
};

struct ReleaseInfo {
    std::string tag_name;
    std::string body;  // Release notes (may carry checksums)
    std::vector<ReleaseAsset> assets;
};

// Where binaries come from. Mocked in installer tests.
class IReleaseSource {
public:
    virtual ~IReleaseSource() = default;

    // GET .../releases/latest
    virtual common::Status fetch_latest(ReleaseInfo &release) = 0;

    // Download url into bytes. Aborts with CANCELLED as soon as *cancel becomes true.
    virtual common::Status download(const std::string &url, std::string &bytes, const std::atomic<bool> *cancel) = 0;
};

// Parse the hosting API's release JSON
bool parse_release_json(const std::string &json_text, ReleaseInfo &release, std::string &error);

// Split "https://host[:port]/path?q" into ("https://host[:port]", "/path?q")
bool split_url(const std::string &url, std::string &origin, std::string &path);

/**
 * @brief GitHub-style release API over cpp-httplib with certificate verification on
 */
class GithubReleaseSource : public IReleaseSource {
public:
    GithubReleaseSource(std::string api_url, std::string repo, int timeout_ms);

    common::Status fetch_latest(ReleaseInfo &release) override;
    common::Status download(const std::string &url, std::string &bytes, const std::atomic<bool> *cancel) override;

private:
    std::string api_url_;
    std::string repo_;
    int timeout_ms_;
};

}  // namespace proxy
}  // namespace proxyvisor

#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "proxy/release_source.hpp"

namespace proxyvisor {
namespace proxy {

struct InstallerOptions {
    std::string target_path;                        // Final binary location
    std::string asset_keyword = "cliproxyapiplus";  // Required substring of the asset name
    size_t min_binary_size = 1000;                  // Sanity floor in bytes
};

// "linux_amd64", "darwin_arm64", ... for the running host; nullopt if unsupported
std::optional<std::string> host_platform_tag();

// Map uname() sysname/machine to a platform tag
std::optional<std::string> platform_tag_for(const std::string &sysname, const std::string &machine);

// The one asset for platform_tag containing keyword, skipping windows and checksum assets
std::optional<ReleaseAsset> select_asset(const std::vector<ReleaseAsset> &assets, const std::string &platform_tag,
                                         const std::string &keyword);

/**
 * @brief Downloads, verifies and installs the proxy binary
 *
 * A checksum is mandatory. Without one, or on mismatch, install() fails and
 * the target path is left exactly as it was. The verified binary is written to
 * a temp file beside the target and renamed into place with mode 0750.
 *
 * cancel() may be called from any thread while install() runs.
 */
class BinaryInstaller {
public:
    BinaryInstaller(IReleaseSource &source, InstallerOptions options);

    common::Status install();

    // Abort an in-flight install(). No-op when idle.
    void cancel();

    bool is_installing() const { return installing_.load(); }

    // Target exists and is executable
    bool is_installed() const;

    const std::string &target_path() const { return options_.target_path; }

    // Overrides host detection (tests, cross installs)
    void set_platform_tag(const std::string &tag) { platform_override_ = tag; }

private:
    common::Status install_impl();
    common::Status resolve_checksum(const ReleaseInfo &release, const ReleaseAsset &asset, std::string &checksum);
    common::Status check_cancelled() const;

    IReleaseSource &source_;
    InstallerOptions options_;
    std::optional<std::string> platform_override_;
    std::atomic<bool> installing_{false};
    std::atomic<bool> cancel_requested_{false};
};

}  // namespace proxy
}  // namespace proxyvisor

#include "binary_installer.hpp"

#include <sys/utsname.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

#include "common/file_util.hpp"
#include "logging/logger.hpp"
#include "proxy/archive_extractor.hpp"
#include "proxy/checksum.hpp"

namespace proxyvisor {
namespace proxy {

namespace {

constexpr const char *kSecurityAbort = "Installation aborted for security.";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

}  // namespace

std::optional<std::string> platform_tag_for(const std::string &sysname, const std::string &machine) {
    const std::string os = to_lower(sysname);
    const std::string arch = to_lower(machine);

    std::string os_tag;
    if (os == "linux") {
        os_tag = "linux";
    } else if (os == "darwin") {
        os_tag = "darwin";
    } else {
        return std::nullopt;
    }

    std::string arch_tag;
    if (arch.find("arm") != std::string::npos || arch.find("aarch64") != std::string::npos) {
        arch_tag = "arm64";
    } else if (arch == "x86_64" || arch == "amd64") {
        arch_tag = "amd64";
    } else {
        return std::nullopt;
    }
    return os_tag + "_" + arch_tag;
}

std::optional<std::string> host_platform_tag() {
    struct utsname info;
    if (uname(&info) != 0) {
        return std::nullopt;
    }
    return platform_tag_for(info.sysname, info.machine);
}

std::optional<ReleaseAsset> select_asset(const std::vector<ReleaseAsset> &assets, const std::string &platform_tag,
                                         const std::string &keyword) {
    const std::string tag = to_lower(platform_tag);
    const std::string required = to_lower(keyword);
    for (const auto &asset : assets) {
        const std::string name = to_lower(asset.name);
        if (name.find("windows") != std::string::npos || name.find("checksum") != std::string::npos) {
            continue;
        }
        if (name.find("sha256") != std::string::npos) {
            continue;
        }
        if (!required.empty() && name.find(required) == std::string::npos) {
            continue;
        }
        if (name.find(tag) != std::string::npos) {
            return asset;
        }
    }
    return std::nullopt;
}

BinaryInstaller::BinaryInstaller(IReleaseSource &source, InstallerOptions options)
    : source_(source), options_(std::move(options)) {}

bool BinaryInstaller::is_installed() const { return common::is_executable_file(options_.target_path); }

void BinaryInstaller::cancel() {
    if (installing_.load()) {
        LOG_INFO("[Installer] Cancellation requested");
        cancel_requested_ = true;
    }
}

common::Status BinaryInstaller::check_cancelled() const {
    if (cancel_requested_.load()) {
        return common::Status::error(common::ErrorCode::CANCELLED, "Installation cancelled");
    }
    return common::Status::ok();
}

common::Status BinaryInstaller::install() {
    bool expected = false;
    if (!installing_.compare_exchange_strong(expected, true)) {
        return common::Status::error(common::ErrorCode::OPERATION_IN_PROGRESS, "An installation is already running");
    }
    cancel_requested_ = false;

    common::Status status;
    try {
        status = install_impl();
    } catch (const std::exception &e) {
        status = common::Status::error(common::ErrorCode::IO_ERROR, std::string("Installation failed: ") + e.what());
    }

    if (!status) {
        LOG_ERROR("[Installer] " << status.message());
    }
    cancel_requested_ = false;
    installing_ = false;
    return status;
}

common::Status BinaryInstaller::install_impl() {
    if (options_.target_path.empty()) {
        return common::Status::error(common::ErrorCode::INVALID_ARGUMENT, "No install path configured");
    }

    auto platform = platform_override_ ? platform_override_ : host_platform_tag();
    if (!platform) {
        return common::Status::error(common::ErrorCode::NO_COMPATIBLE_BINARY,
                                     "Unsupported operating system or architecture");
    }

    ReleaseInfo release;
    auto status = source_.fetch_latest(release);
    if (!status) {
        return status;
    }
    status = check_cancelled();
    if (!status) {
        return status;
    }

    auto asset = select_asset(release.assets, *platform, options_.asset_keyword);
    if (!asset) {
        return common::Status::error(common::ErrorCode::NO_COMPATIBLE_BINARY,
                                     "No compatible binary found for " + *platform + " in release " +
                                         release.tag_name);
    }
    LOG_INFO("[Installer] Selected asset " << asset->name << " for " << *platform);

    std::string expected_checksum;
    status = resolve_checksum(release, *asset, expected_checksum);
    if (!status) {
        return status;
    }
    status = check_cancelled();
    if (!status) {
        return status;
    }

    std::string archive_bytes;
    status = source_.download(asset->download_url, archive_bytes, &cancel_requested_);
    if (!status) {
        return status;
    }
    status = check_cancelled();
    if (!status) {
        return status;
    }

    std::string binary_bytes;
    {
        ScratchDir scratch("proxyvisor-install");
        if (!scratch.valid()) {
            return common::Status::error(common::ErrorCode::IO_ERROR, "Cannot create scratch directory");
        }
        status = extract_binary(archive_bytes, asset->name, scratch.path(), binary_bytes);
        if (!status) {
            return status;
        }
    }
    status = check_cancelled();
    if (!status) {
        return status;
    }

    if (binary_bytes.size() < options_.min_binary_size) {
        return common::Status::error(common::ErrorCode::CORRUPT_BINARY,
                                     "Downloaded binary is too small (" + std::to_string(binary_bytes.size()) +
                                         " bytes) and may be corrupt. " + kSecurityAbort);
    }

    // Checksum files normally cover the archive; some releases hash the binary itself
    const std::string archive_digest = sha256_hex(archive_bytes);
    const std::string binary_digest =
        archive_bytes.size() == binary_bytes.size() && archive_bytes == binary_bytes ? archive_digest
                                                                                    : sha256_hex(binary_bytes);
    if (!checksum_equals(expected_checksum, archive_digest) && !checksum_equals(expected_checksum, binary_digest)) {
        return common::Status::error(common::ErrorCode::CHECKSUM_MISMATCH,
                                     "Checksum mismatch for " + asset->name + ": expected " + expected_checksum +
                                         ", got " + archive_digest + ". " + kSecurityAbort);
    }
    LOG_INFO("[Installer] Checksum verified: " << expected_checksum.substr(0, 16) << "...");

    status = check_cancelled();
    if (!status) {
        return status;
    }

    const auto parent = std::filesystem::path(options_.target_path).parent_path();
    if (!parent.empty()) {
        status = common::ensure_directory(parent.string(), 0700);
        if (!status) {
            return status;
        }
    }
    status = common::write_file_atomic(options_.target_path, binary_bytes, 0750);
    if (!status) {
        return status;
    }

    LOG_INFO("[Installer] Installed " << asset->name << " (" << binary_bytes.size() << " bytes) to "
                                      << options_.target_path);
    return common::Status::ok();
}

common::Status BinaryInstaller::resolve_checksum(const ReleaseInfo &release, const ReleaseAsset &asset,
                                                 std::string &checksum) {
    if (auto from_notes = find_checksum_in_notes(release.body, asset.name)) {
        LOG_INFO("[Installer] Found checksum in release notes: " << from_notes->substr(0, 16) << "...");
        checksum = *from_notes;
        return common::Status::ok();
    }

    for (const ReleaseAsset *candidate : checksum_asset_candidates(release.assets, asset.name)) {
        std::string contents;
        auto status = source_.download(candidate->download_url, contents, &cancel_requested_);
        if (status.code() == common::ErrorCode::CANCELLED) {
            return status;
        }
        if (!status) {
            LOG_WARN("[Installer] Could not fetch checksum asset " << candidate->name << ": " << status.message());
            continue;
        }
        if (auto from_file = parse_checksum_file(contents, asset.name)) {
            LOG_INFO("[Installer] Found checksum in " << candidate->name << ": " << from_file->substr(0, 16)
                                                      << "...");
            checksum = *from_file;
            return common::Status::ok();
        }
    }

    return common::Status::error(common::ErrorCode::CHECKSUM_UNAVAILABLE,
                                 "No SHA-256 checksum published for " + asset.name + ". " + kSecurityAbort);
}

}  // namespace proxy
}  // namespace proxyvisor

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "proxy/release_source.hpp"

namespace proxyvisor {
namespace proxy {

// Lowercase hex SHA-256 of data (OpenSSL EVP)
std::string sha256_hex(const std::string &data);

bool is_sha256_hex(const std::string &s);

// Case-insensitive digest comparison; false if either side is not a SHA-256 hex string
bool checksum_equals(const std::string &a, const std::string &b);

// "foo.tar.gz" -> "foo"; unknown suffixes are returned unchanged
std::string strip_archive_suffix(const std::string &asset_name);

// Search release notes for the asset's SHA-256
std::optional<std::string> find_checksum_in_notes(const std::string &notes, const std::string &asset_name);

// Companion checksum assets for asset_name, most specific first
std::vector<const ReleaseAsset *> checksum_asset_candidates(const std::vector<ReleaseAsset> &assets,
                                                            const std::string &asset_name);

// Extract the digest for asset_name from a sha256sum-style file
std::optional<std::string> parse_checksum_file(const std::string &contents, const std::string &asset_name);

}  // namespace proxy
}  // namespace proxyvisor

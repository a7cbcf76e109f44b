#include "checksum.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "common/file_util.hpp"

namespace proxyvisor {
namespace proxy {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_lines(const std::string &text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

// A 64-hex run not embedded in a longer hex run
std::optional<std::string> find_hex64(const std::string &line) {
    static const std::regex hex64(R"((^|[^0-9A-Fa-f])([0-9A-Fa-f]{64})($|[^0-9A-Fa-f]))");
    std::smatch match;
    if (std::regex_search(line, match, hex64)) {
        return to_lower(match[2].str());
    }
    return std::nullopt;
}

// sha256sum prints "digest  name" or "digest *name"
std::string filename_after_digest(const std::string &rest) {
    std::string name = rest;
    auto begin = name.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    name = name.substr(begin);
    if (!name.empty() && name[0] == '*') {
        name = name.substr(1);
    }
    auto end = name.find_last_not_of(" \t");
    name = name.substr(0, end + 1);
    auto slash = name.find_last_of('/');
    return slash == std::string::npos ? name : name.substr(slash + 1);
}

}  // namespace

std::string sha256_hex(const std::string &data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return common::to_hex(digest, digest_len);
}

bool is_sha256_hex(const std::string &s) {
    return s.size() == 64 && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c); });
}

bool checksum_equals(const std::string &a, const std::string &b) {
    if (!is_sha256_hex(a) || !is_sha256_hex(b)) {
        return false;
    }
    return to_lower(a) == to_lower(b);
}

std::string strip_archive_suffix(const std::string &asset_name) {
    for (const char *suffix : {".tar.gz", ".tgz", ".zip"}) {
        if (ends_with(asset_name, suffix)) {
            return asset_name.substr(0, asset_name.size() - std::string(suffix).size());
        }
    }
    return asset_name;
}

std::optional<std::string> find_checksum_in_notes(const std::string &notes, const std::string &asset_name) {
    const auto lines = split_lines(notes);

    // 1. A line that names the asset
    if (!asset_name.empty()) {
        for (const auto &line : lines) {
            if (line.find(asset_name) == std::string::npos) {
                continue;
            }
            if (auto digest = find_hex64(line)) {
                return digest;
            }
        }
    }

    // 2. A labelled digest: "SHA256: ...", "sha256 - ...", "SHA-256: ..."
    static const std::regex labelled(R"(sha-?256[:\s-]+([0-9a-f]{64})(?![0-9a-f]))", std::regex::icase);
    for (const auto &line : lines) {
        std::smatch match;
        if (std::regex_search(line, match, labelled)) {
            return to_lower(match[1].str());
        }
    }

    // 3. checksum-file convention at line start
    static const std::regex bare(R"(^([0-9a-fA-F]{64})\s+(.*)$)");
    for (const auto &line : lines) {
        std::smatch match;
        if (!std::regex_match(line, match, bare)) {
            continue;
        }
        std::string named = filename_after_digest(match[2].str());
        if (named.empty() || named == asset_name) {
            return to_lower(match[1].str());
        }
    }

    return std::nullopt;
}

std::vector<const ReleaseAsset *> checksum_asset_candidates(const std::vector<ReleaseAsset> &assets,
                                                            const std::string &asset_name) {
    const std::string base = strip_archive_suffix(asset_name);
    const std::vector<std::string> exact = {base + ".sha256", base + ".sha256sum", base + "_sha256.txt",
                                            "sha256-" + base + ".txt", asset_name + ".sha256"};

    std::vector<const ReleaseAsset *> candidates;
    auto add = [&candidates](const ReleaseAsset *asset) {
        if (std::find(candidates.begin(), candidates.end(), asset) == candidates.end()) {
            candidates.push_back(asset);
        }
    };

    for (const auto &name : exact) {
        for (const auto &asset : assets) {
            if (to_lower(asset.name) == to_lower(name)) {
                add(&asset);
            }
        }
    }

    const std::string lower_base = to_lower(base);
    for (const auto &asset : assets) {
        const std::string lower = to_lower(asset.name);
        if (lower.find(lower_base) != std::string::npos && lower.find("sha256") != std::string::npos) {
            add(&asset);
        }
    }

    // A release-wide checksums file covers every asset
    for (const auto &asset : assets) {
        const std::string lower = to_lower(asset.name);
        if (lower.find("checksums") != std::string::npos || lower == "sha256sums" || lower == "sha256sums.txt") {
            add(&asset);
        }
    }
    return candidates;
}

std::optional<std::string> parse_checksum_file(const std::string &contents, const std::string &asset_name) {
    const auto lines = split_lines(contents);
    static const std::regex entry(R"(^\s*([0-9a-fA-F]{64})\s+(.+)$)");

    bool has_named_entries = false;
    for (const auto &line : lines) {
        std::smatch match;
        if (std::regex_match(line, match, entry)) {
            has_named_entries = true;
            if (filename_after_digest(match[2].str()) == asset_name) {
                return to_lower(match[1].str());
            }
        }
    }

    // Multi-entry file without our asset: do not guess
    if (has_named_entries && lines.size() > 1) {
        size_t entries = 0;
        for (const auto &line : lines) {
            if (std::regex_match(line, entry)) {
                ++entries;
            }
        }
        if (entries > 1) {
            return std::nullopt;
        }
    }

    for (const auto &line : lines) {
        if (auto digest = find_hex64(line)) {
            return digest;
        }
    }
    return std::nullopt;
}

}  // namespace proxy
}  // namespace proxyvisor

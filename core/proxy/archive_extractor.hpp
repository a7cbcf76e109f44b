#pragma once

#include <string>

#include "common/status.hpp"

namespace proxyvisor {
namespace proxy {

// Private mkdtemp directory, removed recursively on destruction
class ScratchDir {
public:
    explicit ScratchDir(const std::string &prefix = "proxyvisor");
    ~ScratchDir();

    ScratchDir(const ScratchDir &) = delete;
    ScratchDir &operator=(const ScratchDir &) = delete;

    bool valid() const { return !path_.empty(); }
    const std::string &path() const { return path_; }

private:
    std::string path_;
};

// True for members that are documentation or checksums rather than the binary
bool is_doc_member(const std::string &name);

// True if the name looks like an archive libarchive should open
bool is_archive_name(const std::string &asset_name);

/**
 * @brief Extract the single executable from an archive held in memory
 *
 * Members are written under scratch_dir. Absolute paths, ".." components
 * and links are skipped. Preference:
 * 1. first regular, non-doc member with an execute bit
 * 2. first regular, non-doc member (zip archives often carry no modes)
 * 3. any executable regular file found by walking scratch_dir
 *
 * Non-archive asset names are returned as-is (the asset is the binary).
 */
common::Status extract_binary(const std::string &archive_bytes, const std::string &asset_name,
                              const std::string &scratch_dir, std::string &binary_bytes);

}  // namespace proxy
}  // namespace proxyvisor

#include "archive_extractor.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <vector>

#include "common/file_util.hpp"
#include "logging/logger.hpp"

namespace proxyvisor {
namespace proxy {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Rejects absolute paths and ".." components (zip-slip)
bool is_path_safe(const char *pathname) {
    if (!pathname || pathname[0] == '\0') return false;
    if (pathname[0] == '/') return false;

    const char *p = pathname;
    while (*p) {
        if (p[0] == '.' && p[1] == '.') {
            if ((p == pathname || *(p - 1) == '/') && (p[2] == '/' || p[2] == '\0')) {
                return false;
            }
        }
        p++;
    }
    return true;
}

struct Candidate {
    std::string path;
    bool executable = false;
};

}  // namespace

ScratchDir::ScratchDir(const std::string &prefix) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }
    std::string tmpl = (base / (prefix + "-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) != nullptr) {
        path_ = buf.data();
    } else {
        LOG_ERROR("[Extract] mkdtemp failed for " << tmpl << ": " << std::strerror(errno));
    }
}

ScratchDir::~ScratchDir() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        LOG_WARN("[Extract] Could not remove scratch dir " << path_ << ": " << ec.message());
    }
}

bool is_doc_member(const std::string &name) {
    return ends_with(name, ".txt") || ends_with(name, ".md") || ends_with(name, ".sha256");
}

bool is_archive_name(const std::string &asset_name) {
    return ends_with(asset_name, ".tar.gz") || ends_with(asset_name, ".tgz") || ends_with(asset_name, ".zip");
}

common::Status extract_binary(const std::string &archive_bytes, const std::string &asset_name,
                              const std::string &scratch_dir, std::string &binary_bytes) {
    if (!is_archive_name(asset_name)) {
        LOG_INFO("[Extract] " << asset_name << " is not an archive, using it as the binary");
        binary_bytes = archive_bytes;
        return common::Status::ok();
    }

    std::unique_ptr<struct archive, decltype(&archive_read_free)> reader(archive_read_new(), archive_read_free);
    std::unique_ptr<struct archive, decltype(&archive_write_free)> writer(archive_write_disk_new(),
                                                                          archive_write_free);
    if (!reader || !writer) {
        return common::Status::error(common::ErrorCode::EXTRACTION_FAILED, "libarchive allocation failed");
    }

    archive_read_support_format_all(reader.get());
    archive_read_support_filter_all(reader.get());

    // Paths are rewritten to absolute scratch paths below, so only ".." is enforced by libarchive
    int flags = ARCHIVE_EXTRACT_PERM | ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    archive_write_disk_set_options(writer.get(), flags);

    if (archive_read_open_memory(reader.get(), archive_bytes.data(), archive_bytes.size()) != ARCHIVE_OK) {
        return common::Status::error(common::ErrorCode::EXTRACTION_FAILED,
                                     std::string("Cannot open archive ") + asset_name + ": " +
                                         archive_error_string(reader.get()));
    }

    const std::string dest_dir = scratch_dir.back() == '/' ? scratch_dir : scratch_dir + "/";
    std::vector<Candidate> candidates;

    while (true) {
        struct archive_entry *entry = nullptr;
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return common::Status::error(common::ErrorCode::EXTRACTION_FAILED,
                                         std::string("Corrupt archive ") + asset_name + ": " +
                                             archive_error_string(reader.get()));
        }

        const char *pathname = archive_entry_pathname(entry);
        if (!is_path_safe(pathname)) {
            LOG_WARN("[Extract] Skipping unsafe path: " << (pathname ? pathname : "<null>"));
            archive_read_data_skip(reader.get());
            continue;
        }

        const unsigned int type = archive_entry_filetype(entry);
        if (type == AE_IFLNK || (archive_entry_hardlink(entry) != nullptr)) {
            LOG_WARN("[Extract] Skipping link member: " << pathname);
            archive_read_data_skip(reader.get());
            continue;
        }

        const std::string member = pathname;
        const std::string full_path = dest_dir + member;
        archive_entry_set_pathname(entry, full_path.c_str());

        if (archive_write_header(writer.get(), entry) != ARCHIVE_OK) {
            LOG_WARN("[Extract] Cannot write " << member << ": " << archive_error_string(writer.get()));
            archive_read_data_skip(reader.get());
            continue;
        }

        if (type == AE_IFREG && archive_entry_size(entry) > 0) {
            const void *buff;
            size_t size;
            la_int64_t offset;
            while (true) {
                r = archive_read_data_block(reader.get(), &buff, &size, &offset);
                if (r == ARCHIVE_EOF) {
                    break;
                }
                if (r != ARCHIVE_OK) {
                    return common::Status::error(common::ErrorCode::EXTRACTION_FAILED,
                                                 "Read failed for " + member + ": " +
                                                     archive_error_string(reader.get()));
                }
                if (archive_write_data_block(writer.get(), buff, size, offset) != ARCHIVE_OK) {
                    return common::Status::error(common::ErrorCode::EXTRACTION_FAILED,
                                                 "Write failed for " + member + ": " +
                                                     archive_error_string(writer.get()));
                }
            }
        }
        archive_write_finish_entry(writer.get());

        if (type == AE_IFREG && !is_doc_member(member)) {
            candidates.push_back({full_path, (archive_entry_perm(entry) & 0111) != 0});
        }
    }

    std::string chosen;
    for (const auto &candidate : candidates) {
        if (candidate.executable) {
            chosen = candidate.path;
            break;
        }
    }
    if (chosen.empty() && !candidates.empty()) {
        chosen = candidates.front().path;
    }
    if (chosen.empty()) {
        std::error_code ec;
        for (fs::recursive_directory_iterator it(scratch_dir, ec), end; !ec && it != end; it.increment(ec)) {
            const std::string name = it->path().filename().string();
            if (it->is_regular_file() && !is_doc_member(name) && common::is_executable_file(it->path().string())) {
                chosen = it->path().string();
                break;
            }
        }
    }

    if (chosen.empty()) {
        return common::Status::error(common::ErrorCode::EXTRACTION_FAILED, "Binary not found in archive " + asset_name);
    }
    if (!common::read_file(chosen, binary_bytes)) {
        return common::Status::error(common::ErrorCode::EXTRACTION_FAILED, "Cannot read extracted file " + chosen);
    }

    LOG_INFO("[Extract] Selected " << fs::path(chosen).filename().string() << " (" << binary_bytes.size()
                                   << " bytes) from " << asset_name);
    return common::Status::ok();
}

}  // namespace proxy
}  // namespace proxyvisor

#pragma once

#include <sys/types.h>

#include <string>

#include "common/status.hpp"

namespace proxyvisor {
namespace common {

// Write contents to a sibling temp file created with `mode`, fsync, then rename
// over `path`. On failure the temp file is removed and `path` is untouched.
Status write_file_atomic(const std::string &path, const std::string &contents, mode_t mode);

// Read a whole file. Returns false if it cannot be opened.
bool read_file(const std::string &path, std::string &contents);

// mkdir -p, then chmod the leaf to `mode`
Status ensure_directory(const std::string &path, mode_t mode);

// Owner-executable regular file
bool is_executable_file(const std::string &path);

// Hex encoding helper shared by key generation and digests
std::string to_hex(const unsigned char *data, size_t len);

// Random RFC 4122 version 4 UUID (lowercase)
std::string generate_uuid4();

}  // namespace common
}  // namespace proxyvisor

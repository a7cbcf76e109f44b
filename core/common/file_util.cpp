#include "file_util.hpp"

#include <fcntl.h>
#include <openssl/rand.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace proxyvisor {
namespace common {

namespace fs = std::filesystem;

Status write_file_atomic(const std::string &path, const std::string &contents, mode_t mode) {
    fs::path target(path);
    fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");

    std::string tmpl = (dir / ("." + target.filename().string() + ".tmp-XXXXXX")).string();
    std::vector<char> tmp_path(tmpl.begin(), tmpl.end());
    tmp_path.push_back('\0');

    int fd = mkstemp(tmp_path.data());
    if (fd < 0) {
        return Status::error(ErrorCode::IO_ERROR,
                             "Cannot create temp file in " + dir.string() + ": " + std::strerror(errno));
    }

    auto fail = [&](const std::string &what) {
        int saved = errno;
        close(fd);
        unlink(tmp_path.data());
        return Status::error(ErrorCode::IO_ERROR, what + " " + path + ": " + std::strerror(saved));
    };

    if (fchmod(fd, mode) != 0) {
        return fail("Cannot set permissions for");
    }

    const char *data = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t n = write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return fail("Write failed for");
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    if (fsync(fd) != 0) {
        return fail("fsync failed for");
    }
    if (close(fd) != 0) {
        int saved = errno;
        unlink(tmp_path.data());
        return Status::error(ErrorCode::IO_ERROR, "Close failed for " + path + ": " + std::strerror(saved));
    }

    if (rename(tmp_path.data(), path.c_str()) != 0) {
        int saved = errno;
        unlink(tmp_path.data());
        return Status::error(ErrorCode::IO_ERROR, "Cannot move file into place at " + path + ": " +
                                                      std::strerror(saved));
    }
    return Status::ok();
}

bool read_file(const std::string &path, std::string &contents) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    contents = ss.str();
    return true;
}

Status ensure_directory(const std::string &path, mode_t mode) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return Status::error(ErrorCode::IO_ERROR, "Cannot create directory " + path + ": " + ec.message());
    }
    if (chmod(path.c_str(), mode) != 0) {
        return Status::error(ErrorCode::IO_ERROR,
                             "Cannot set permissions on " + path + ": " + std::strerror(errno));
    }
    return Status::ok();
}

bool is_executable_file(const std::string &path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::string to_hex(const unsigned char *data, size_t len) {
    static const char *digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string generate_uuid4() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    std::string hex = to_hex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" +
           hex.substr(20, 12);
}

}  // namespace common
}  // namespace proxyvisor

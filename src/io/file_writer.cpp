// file_writer.cpp - Writer for regular files materialized from an archive.

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace seed {

Result FileWriter::Open(std::string path, mode_t mode, FileWriter& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        return Result::Fail(
            errno, "Failed to create file: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);

    // open(2) masks the mode with the umask.
    if (::fchmod(fd, mode) != 0) {
        return Result::Fail(
            errno, "Failed to set mode on: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::Fail(errno,
                            "Write failed: " + path_ + " (" + std::strerror(errno) + ")");
    }

    return Result::Ok();
}

Result FileWriter::Close() {
    if (const int e = fd_.Close(); e != 0) {
        return Result::Fail(e, "Close failed: " + path_ + " (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace seed

#include "io/file_reader.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace seed {

Result FileOrStdinReader::Open(std::string path, FileOrStdinReader& out) {
    out.path_ = std::move(path);

    if (out.path_ == "-") {
        out.fd_.Reset(STDIN_FILENO);
        out.size_ = std::nullopt;
        return Result::Ok();
    }

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result::Fail(
            errno, "Failed to open input: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) == 0 && S_ISREG(st.st_mode) && st.st_size > 0) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileOrStdinReader::TotalSize() const { return size_; }

ssize_t FileOrStdinReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result ReadAll(IReader& reader, std::vector<std::uint8_t>& out) {
    out.clear();
    if (auto total = reader.TotalSize()) {
        out.reserve(static_cast<size_t>(*total));
    }

    std::array<std::uint8_t, 64 * 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            return Result::Fail(errno, std::string("Read failed (") + std::strerror(errno) + ")");
        }
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    return Result::Ok();
}

Result ReadFileOrStdin(const std::string& path, std::vector<std::uint8_t>& out) {
    FileOrStdinReader reader;
    if (auto r = FileOrStdinReader::Open(path, reader); !r.ok) {
        return r;
    }
    auto r = ReadAll(reader, out);
    if (!r.ok) {
        r.msg = path + ": " + r.msg;
    }
    return r;
}

Result ReadFileOrStdin(const std::string& path, std::string& out) {
    std::vector<std::uint8_t> bytes;
    auto r = ReadFileOrStdin(path, bytes);
    if (!r.ok) return r;
    out.assign(bytes.begin(), bytes.end());
    return Result::Ok();
}

} // namespace seed

#include "io/fd.hpp"

#include <cerrno>
#include <unistd.h>

namespace seed {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        (void)Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { (void)Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

int Fd::Close() {
    int rc = 0;
    if (fd_ > STDERR_FILENO) {
        if (::close(fd_) != 0) rc = errno;
    }
    fd_ = -1;
    return rc;
}

} // namespace seed

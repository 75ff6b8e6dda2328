#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>

namespace curator {

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

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void Fd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

Result Fd::Close() {
    if (fd_ < 0) return Result::Ok();
    const int fd = fd_;
    fd_ = -1;
    // The descriptor is released even when close() reports an error.
    if (::close(fd) != 0 && errno != EINTR) {
        return Result::Fail(errno, "close failed (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

} // namespace curator

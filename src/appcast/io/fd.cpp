#include "appcast/io/fd.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace appcast {

Fd::Fd(int fd) : fd_(fd) {}

Fd Fd::OpenReadOnly(const std::string& path) {
    int fd;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    return Fd(fd);
}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other)
        Reset(other.Release());
    return *this;
}

Fd::~Fd() { Reset(); }

int Fd::Release() { return std::exchange(fd_, -1); }

void Fd::Reset(int fd) {
    if (fd_ >= 0 && fd_ != fd) {
        const int saved = errno;
        ::close(fd_);
        errno = saved;
    }
    fd_ = fd;
}

} // namespace appcast

#include <msgdec/io/fd_source.h>

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace msgdec::io {

FdSource::FdSource(int fd, bool owns_fd) : fd_(fd), owns_fd_(owns_fd) {}

FdSource::~FdSource() {
    close();
}

FdSource::FdSource(FdSource&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      owns_fd_(std::exchange(other.owns_fd_, false)) {}

FdSource& FdSource::operator=(FdSource&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        owns_fd_ = std::exchange(other.owns_fd_, false);
    }
    return *this;
}

ReadResult FdSource::read(uint8_t* buffer, std::size_t size) {
    ReadResult result;
    if (!is_open()) {
        result.message = "descriptor is closed";
        return result;
    }
    if (size == 0) {
        result.ok = true;
        return result;
    }

    while (true) {
        ssize_t n = ::read(fd_, buffer, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            result.message = std::string("read failed: ") + std::strerror(errno);
            return result;
        }
        if (n == 0) {
            result.message = "end of stream";
            return result;
        }
        result.count = static_cast<std::size_t>(n);
        result.ok = true;
        return result;
    }
}

void FdSource::close() {
    if (fd_ >= 0 && owns_fd_) {
        ::close(fd_);
    }
    fd_ = -1;
    owns_fd_ = false;
}

bool FdSource::is_open() const {
    return fd_ >= 0;
}

}  // namespace msgdec::io

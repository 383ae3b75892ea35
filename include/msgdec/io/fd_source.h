#pragma once
#include <msgdec/io/byte_source.h>

namespace msgdec::io {

// Reads from a POSIX file descriptor, one ::read per call.
class FdSource : public ByteSource {
public:
    // When owns_fd is set the descriptor is closed on destruction.
    explicit FdSource(int fd, bool owns_fd = false);

    ~FdSource() override;

    // Move-only
    FdSource(FdSource&& other) noexcept;
    FdSource& operator=(FdSource&& other) noexcept;
    FdSource(const FdSource&) = delete;
    FdSource& operator=(const FdSource&) = delete;

    ReadResult read(uint8_t* buffer, std::size_t size) override;

    void close();
    bool is_open() const;

    int fd() const { return fd_; }

private:
    int fd_ = -1;
    bool owns_fd_ = false;
};

}  // namespace msgdec::io

#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace msgdec::io {

struct ReadResult {
    std::size_t count = 0;
    bool ok = false;
    std::string message;
};

// Sequential, blocking byte stream. A read may deliver fewer bytes than
// requested; end of stream is reported as a failed read.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual ReadResult read(uint8_t* buffer, std::size_t size) = 0;
};

class MemorySource : public ByteSource {
public:
    // Non-owning view; the range must outlive the source.
    MemorySource(const uint8_t* data, std::size_t size);
    // Owning copy.
    explicit MemorySource(std::vector<uint8_t> data);

    MemorySource(const MemorySource&) = delete;
    MemorySource& operator=(const MemorySource&) = delete;

    ReadResult read(uint8_t* buffer, std::size_t size) override;

    std::size_t remaining() const { return size_ - offset_; }
    bool has_remaining() const { return offset_ < size_; }

private:
    std::vector<uint8_t> owned_;
    const uint8_t* data_;
    std::size_t size_;
    std::size_t offset_ = 0;
};

class StreamSource : public ByteSource {
public:
    explicit StreamSource(std::istream& stream);

    ReadResult read(uint8_t* buffer, std::size_t size) override;

private:
    std::istream& stream_;
};

}  // namespace msgdec::io

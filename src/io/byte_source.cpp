#include <msgdec/io/byte_source.h>

#include <algorithm>
#include <cstring>
#include <utility>

namespace msgdec::io {

namespace {

constexpr const char kEndOfStream[] = "end of stream";

ReadResult read_failed(std::string message) {
    ReadResult result;
    result.ok = false;
    result.message = std::move(message);
    return result;
}

}  // namespace

// ---------------------------------------------------------------------------
// MemorySource
// ---------------------------------------------------------------------------

MemorySource::MemorySource(const uint8_t* data, std::size_t size)
    : data_(data), size_(data == nullptr ? 0 : size) {}

MemorySource::MemorySource(std::vector<uint8_t> data)
    : owned_(std::move(data)), data_(owned_.data()), size_(owned_.size()) {}

ReadResult MemorySource::read(uint8_t* buffer, std::size_t size) {
    if (size == 0) {
        return {0, true, {}};
    }
    if (offset_ >= size_) {
        return read_failed(kEndOfStream);
    }
    std::size_t count = std::min(size, size_ - offset_);
    std::memcpy(buffer, data_ + offset_, count);
    offset_ += count;
    return {count, true, {}};
}

// ---------------------------------------------------------------------------
// StreamSource
// ---------------------------------------------------------------------------

StreamSource::StreamSource(std::istream& stream) : stream_(stream) {}

ReadResult StreamSource::read(uint8_t* buffer, std::size_t size) {
    if (size == 0) {
        return {0, true, {}};
    }
    if (stream_.bad()) {
        return read_failed("stream is in a bad state");
    }
    if (stream_.eof()) {
        return read_failed(kEndOfStream);
    }

    stream_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(size));
    auto count = static_cast<std::size_t>(stream_.gcount());
    if (stream_.bad()) {
        return read_failed("stream read failed");
    }
    if (count == 0) {
        return read_failed(kEndOfStream);
    }
    return {count, true, {}};
}

}  // namespace msgdec::io

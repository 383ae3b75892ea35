#pragma once
#include <msgdec/core/config.h>
#include <msgdec/core/error.h>
#include <msgdec/io/byte_source.h>

#include <array>
#include <cstdint>

namespace msgdec::io {

// Pulls exact byte counts from a ByteSource. A short first read gets exactly
// one retry for the remainder; anything still missing is a read fault.
// Fixed-width reads go through a scratch buffer owned by this instance.
class ByteReader {
public:
    explicit ByteReader(ByteSource& source);

    ByteReader(const ByteReader&) = delete;
    ByteReader& operator=(const ByteReader&) = delete;

    core::DecodeResult read_exact(uint8_t* buffer, std::size_t size);

    core::DecodeResult read_u8(uint8_t& value);
    core::DecodeResult read_u16(uint16_t& value);
    core::DecodeResult read_u32(uint32_t& value);
    core::DecodeResult read_u64(uint64_t& value);

    // Total bytes delivered since construction.
    uint64_t consumed() const { return consumed_; }

private:
    ByteSource& source_;
    std::array<uint8_t, core::config::kScratchBufferSize> scratch_{};
    uint64_t consumed_ = 0;
};

}  // namespace msgdec::io

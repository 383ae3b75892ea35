#include <msgdec/io/byte_reader.h>

#include <string>

namespace msgdec::io {

ByteReader::ByteReader(ByteSource& source) : source_(source) {}

core::DecodeResult ByteReader::read_exact(uint8_t* buffer, std::size_t size) {
    if (size == 0) {
        return core::decode_ok();
    }

    std::size_t total = 0;
    for (int attempt = 0; attempt <= core::config::kReadRetries; ++attempt) {
        ReadResult r = source_.read(buffer + total, size - total);
        if (!r.ok) {
            return core::decode_error(core::ErrorKind::Read,
                "read: " + r.message + " (expecting " + std::to_string(size) +
                " bytes, received " + std::to_string(total) + ")");
        }
        total += r.count;
        consumed_ += r.count;
        if (total == size) {
            return core::decode_ok();
        }
    }
    return core::decode_error(core::ErrorKind::Read,
        "read: incorrect number of bytes read. Expecting: " + std::to_string(size) +
        ", received: " + std::to_string(total));
}

core::DecodeResult ByteReader::read_u8(uint8_t& value) {
    auto r = read_exact(scratch_.data(), 1);
    if (!r.ok) return r;
    value = scratch_[0];
    return r;
}

core::DecodeResult ByteReader::read_u16(uint16_t& value) {
    auto r = read_exact(scratch_.data(), 2);
    if (!r.ok) return r;
    value = static_cast<uint16_t>(static_cast<uint16_t>(scratch_[0]) << 8
                                | static_cast<uint16_t>(scratch_[1]));
    return r;
}

core::DecodeResult ByteReader::read_u32(uint32_t& value) {
    auto r = read_exact(scratch_.data(), 4);
    if (!r.ok) return r;
    value = static_cast<uint32_t>(scratch_[0]) << 24
          | static_cast<uint32_t>(scratch_[1]) << 16
          | static_cast<uint32_t>(scratch_[2]) << 8
          | static_cast<uint32_t>(scratch_[3]);
    return r;
}

core::DecodeResult ByteReader::read_u64(uint64_t& value) {
    auto r = read_exact(scratch_.data(), 8);
    if (!r.ok) return r;
    value = static_cast<uint64_t>(scratch_[0]) << 56
          | static_cast<uint64_t>(scratch_[1]) << 48
          | static_cast<uint64_t>(scratch_[2]) << 40
          | static_cast<uint64_t>(scratch_[3]) << 32
          | static_cast<uint64_t>(scratch_[4]) << 24
          | static_cast<uint64_t>(scratch_[5]) << 16
          | static_cast<uint64_t>(scratch_[6]) << 8
          | static_cast<uint64_t>(scratch_[7]);
    return r;
}

}  // namespace msgdec::io

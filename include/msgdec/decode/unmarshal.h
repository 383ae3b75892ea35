#pragma once
#include <msgdec/core/error.h>
#include <msgdec/decode/decoder.h>
#include <msgdec/decode/resolver.h>
#include <msgdec/io/byte_source.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace msgdec::decode {

// Decodes the first value in data into target. Bytes after that value are
// ignored.
template <typename T>
core::DecodeResult unmarshal(const uint8_t* data, std::size_t size, T* target,
                             std::shared_ptr<const ContainerResolver> resolver = nullptr) {
    io::MemorySource source(data, size);
    Decoder decoder(source, std::move(resolver));
    return decoder.decode(target);
}

template <typename T>
core::DecodeResult unmarshal(const std::vector<uint8_t>& data, T* target,
                             std::shared_ptr<const ContainerResolver> resolver = nullptr) {
    return unmarshal(data.data(), data.size(), target, std::move(resolver));
}

}  // namespace msgdec::decode

#pragma once
#include <msgdec/core/error.h>
#include <msgdec/io/byte_reader.h>
#include <msgdec/value/value.h>
#include <msgdec/wire/format.h>

#include <cstddef>
#include <cstdint>

namespace msgdec::decode {

struct ProbeResult {
    core::DecodeResult status;
    // True when the value is complete: nil or a scalar was written.
    bool handled = false;
    // Set when handled is false: the container the tag announced and its
    // length. The body has not been consumed.
    wire::ContainerType container = wire::ContainerType::RawBytes;
    std::size_t length = 0;
};

// First step for an open slot. Scalars and nil are decoded straight into
// the target; container tags only have their length read so a resolver can
// pick the concrete shape.
class DynamicProbe {
public:
    explicit DynamicProbe(io::ByteReader& reader);

    ProbeResult probe(uint8_t tag, value::Value& target);

private:
    io::ByteReader& reader_;
};

}  // namespace msgdec::decode

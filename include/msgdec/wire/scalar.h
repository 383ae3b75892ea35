#pragma once
#include <msgdec/core/error.h>
#include <msgdec/io/byte_reader.h>

#include <cstdint>

namespace msgdec::wire {

// One scalar read off the wire, in the family its tag names.
struct Scalar {
    enum class Family {
        Bool,
        Int,      // int8..int64 tags and both fixnum ranges
        Uint,     // uint8..uint64 tags
        Float32,
        Float64,
    };

    Family family = Family::Bool;
    bool boolean = false;
    int64_t int_value = 0;
    uint64_t uint_value = 0;
    double float_value = 0.0;
};

// Reads the body of a scalar whose tag byte is already consumed. Signed
// widths are sign-extended from their raw width; float bit patterns are
// big-endian IEEE-754. A tag that is not a scalar tag is a format fault.
core::DecodeResult read_scalar(io::ByteReader& reader, uint8_t tag, Scalar& out);

}  // namespace msgdec::wire

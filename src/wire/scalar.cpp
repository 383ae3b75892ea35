#include <msgdec/wire/scalar.h>
#include <msgdec/wire/format.h>

#include <bit>

namespace msgdec::wire {

core::DecodeResult read_scalar(io::ByteReader& reader, uint8_t tag, Scalar& out) {
    if (is_positive_fixnum(tag)) {
        out.family = Scalar::Family::Int;
        out.int_value = tag;
        return core::decode_ok();
    }
    if (is_negative_fixnum(tag)) {
        out.family = Scalar::Family::Int;
        out.int_value = static_cast<int8_t>(tag);
        return core::decode_ok();
    }

    core::DecodeResult r = core::decode_ok();
    switch (tag) {
        case kFalse:
        case kTrue:
            out.family = Scalar::Family::Bool;
            out.boolean = tag == kTrue;
            return r;
        case kFloat32: {
            uint32_t bits = 0;
            r = reader.read_u32(bits);
            out.family = Scalar::Family::Float32;
            out.float_value = std::bit_cast<float>(bits);
            return r;
        }
        case kFloat64: {
            uint64_t bits = 0;
            r = reader.read_u64(bits);
            out.family = Scalar::Family::Float64;
            out.float_value = std::bit_cast<double>(bits);
            return r;
        }
        case kUint8: {
            uint8_t v = 0;
            r = reader.read_u8(v);
            out.family = Scalar::Family::Uint;
            out.uint_value = v;
            return r;
        }
        case kUint16: {
            uint16_t v = 0;
            r = reader.read_u16(v);
            out.family = Scalar::Family::Uint;
            out.uint_value = v;
            return r;
        }
        case kUint32: {
            uint32_t v = 0;
            r = reader.read_u32(v);
            out.family = Scalar::Family::Uint;
            out.uint_value = v;
            return r;
        }
        case kUint64: {
            uint64_t v = 0;
            r = reader.read_u64(v);
            out.family = Scalar::Family::Uint;
            out.uint_value = v;
            return r;
        }
        case kInt8: {
            uint8_t v = 0;
            r = reader.read_u8(v);
            out.family = Scalar::Family::Int;
            out.int_value = static_cast<int8_t>(v);
            return r;
        }
        case kInt16: {
            uint16_t v = 0;
            r = reader.read_u16(v);
            out.family = Scalar::Family::Int;
            out.int_value = static_cast<int16_t>(v);
            return r;
        }
        case kInt32: {
            uint32_t v = 0;
            r = reader.read_u32(v);
            out.family = Scalar::Family::Int;
            out.int_value = static_cast<int32_t>(v);
            return r;
        }
        case kInt64: {
            uint64_t v = 0;
            r = reader.read_u64(v);
            out.family = Scalar::Family::Int;
            out.int_value = static_cast<int64_t>(v);
            return r;
        }
        default:
            break;
    }
    return core::decode_error(core::ErrorKind::Format,
        "unrecognized scalar descriptor byte: " + describe_tag(tag));
}

}  // namespace msgdec::wire

#include <msgdec/decode/dynamic_probe.h>
#include <msgdec/wire/container_length.h>
#include <msgdec/wire/scalar.h>

namespace msgdec::decode {

DynamicProbe::DynamicProbe(io::ByteReader& reader) : reader_(reader) {}

ProbeResult DynamicProbe::probe(uint8_t tag, value::Value& target) {
    ProbeResult result;

    if (tag == wire::kNil) {
        target = value::Value();
        result.status = core::decode_ok();
        result.handled = true;
        return result;
    }

    if (wire::is_scalar_tag(tag)) {
        wire::Scalar scalar;
        result.status = wire::read_scalar(reader_, tag, scalar);
        if (!result.status.ok) {
            return result;
        }
        switch (scalar.family) {
            case wire::Scalar::Family::Bool:
                target = value::Value(scalar.boolean);
                break;
            case wire::Scalar::Family::Int:
                target = value::Value(scalar.int_value);
                break;
            case wire::Scalar::Family::Uint:
                target = value::Value(scalar.uint_value);
                break;
            case wire::Scalar::Family::Float32:
            case wire::Scalar::Family::Float64:
                target = value::Value(scalar.float_value);
                break;
        }
        result.handled = true;
        return result;
    }

    auto container = wire::container_type_of(tag);
    if (!container) {
        result.status = core::decode_error(core::ErrorKind::Format,
            "unrecognized descriptor byte: " + wire::describe_tag(tag));
        return result;
    }

    result.container = *container;
    result.status = wire::read_container_length(reader_, tag, *container, result.length);
    return result;
}

}  // namespace msgdec::decode

#include <msgdec/decode/decoder.h>
#include <msgdec/wire/container_length.h>
#include <msgdec/wire/scalar.h>

#include <utility>

namespace msgdec::decode {

namespace {

const char* family_name(wire::Scalar::Family family) {
    switch (family) {
        case wire::Scalar::Family::Bool:    return "bool";
        case wire::Scalar::Family::Int:     return "signed integer";
        case wire::Scalar::Family::Uint:    return "unsigned integer";
        case wire::Scalar::Family::Float32: return "float32";
        case wire::Scalar::Family::Float64: return "float64";
    }
    return "unknown";
}

core::DecodeResult wrong_family(wire::Scalar::Family family, const char* destination) {
    return core::decode_error(core::ErrorKind::Type,
        std::string("cannot decode ") + family_name(family) + " into " + destination +
        " destination");
}

// A container already announced (a resolver boxed a scalar for it) is a
// type fault; a non-scalar tag is a format fault.
core::DecodeResult not_scalar(const Descriptor& desc, const char* destination) {
    if (desc.has_length) {
        return core::decode_error(core::ErrorKind::Type,
            std::string("cannot decode ") + wire::container_type_name(desc.container) +
            " into " + destination + " destination");
    }
    return core::decode_error(core::ErrorKind::Format,
        std::string("unrecognized descriptor byte for ") + destination + " destination: " +
        wire::describe_tag(desc.tag));
}

}  // namespace

Decoder::Decoder(io::ByteSource& source, std::shared_ptr<const ContainerResolver> resolver)
    : Decoder(source, DecoderOptions{std::move(resolver), nullptr,
                                     core::config::kDefaultMaxContainerLength}) {}

Decoder::Decoder(io::ByteSource& source, DecoderOptions options)
    : reader_(source),
      probe_(reader_),
      resolver_(options.resolver ? std::move(options.resolver) : default_resolver()),
      diagnostics_(options.diagnostics),
      max_container_length_(options.max_container_length) {}

core::DecodeResult Decoder::decode_value(const Destination& destination) {
    ++calls_;
    call_start_ = reader_.consumed();
    fault_stage_ = nullptr;
    if (diagnostics_ != nullptr) {
        diagnostics_->begin_call(calls_);
    }

    core::DecodeResult result;
    if (!destination.valid()) {
        result = fail("usage", core::decode_error(core::ErrorKind::Usage,
            "cannot decode into a null or absent destination"));
    } else {
        result = decode_destination(destination);
    }
    finish(result);
    return result;
}

void Decoder::finish(const core::DecodeResult& result) {
    if (diagnostics_ == nullptr) {
        return;
    }
    if (result.ok) {
        diagnostics_->emit(core::Severity::Info, core::config::kDiagnosticModule, "decode",
            "decoded value of " + std::to_string(reader_.consumed() - call_start_) + " bytes",
            reader_.consumed());
    } else {
        diagnostics_->emit(core::Severity::Error, core::config::kDiagnosticModule,
            fault_stage_ != nullptr ? fault_stage_ : "value", result.message, reader_.consumed());
    }
}

core::DecodeResult Decoder::fail(const char* stage, core::DecodeResult result) {
    if (!result.ok && fault_stage_ == nullptr) {
        fault_stage_ = result.kind == core::ErrorKind::Read ? "read" : stage;
    }
    return result;
}

core::DecodeResult Decoder::read_descriptor(Descriptor& desc) {
    desc = Descriptor{};
    return fail("read", reader_.read_u8(desc.tag));
}

core::DecodeResult Decoder::dispatch(const Destination& dest, const Descriptor& desc) {
    if (!dest.valid()) {
        return fail("usage", core::decode_error(core::ErrorKind::Usage,
            "cannot decode into a null or absent destination"));
    }
    return dest.decode_(*this, dest.target_, desc);
}

core::DecodeResult Decoder::decode_destination(const Destination& dest) {
    Descriptor desc;
    auto r = read_descriptor(desc);
    if (!r.ok) return r;
    return dispatch(dest, desc);
}

// ---------------------------------------------------------------------------
// Lengths
// ---------------------------------------------------------------------------

core::DecodeResult Decoder::container_length(Descriptor& desc, wire::ContainerType type) {
    if (desc.has_length) {
        if (desc.container != type) {
            return fail("value", core::decode_error(core::ErrorKind::Type,
                std::string("cannot decode ") + wire::container_type_name(desc.container) +
                " into " + wire::container_type_name(type) + " destination"));
        }
        return core::decode_ok();
    }

    auto actual = wire::container_type_of(desc.tag);
    if (!actual) {
        if (!wire::is_recognized_tag(desc.tag)) {
            return fail("value", core::decode_error(core::ErrorKind::Format,
                "unrecognized descriptor byte: " + wire::describe_tag(desc.tag)));
        }
        return fail("value", core::decode_error(core::ErrorKind::Type,
            std::string("cannot decode scalar ") + wire::describe_tag(desc.tag) +
            " into " + wire::container_type_name(type) + " destination"));
    }
    if (*actual != type) {
        return fail("value", core::decode_error(core::ErrorKind::Type,
            std::string("cannot decode ") + wire::container_type_name(*actual) +
            " into " + wire::container_type_name(type) + " destination"));
    }

    auto r = fail("length", wire::read_container_length(reader_, desc.tag, type, desc.length));
    if (!r.ok) return r;
    desc.has_length = true;
    desc.container = type;
    return check_length(desc.length);
}

core::DecodeResult Decoder::check_length(std::size_t length) {
    if (length > max_container_length_) {
        return fail("length", core::decode_error(core::ErrorKind::Format,
            "container length " + std::to_string(length) + " exceeds limit " +
            std::to_string(max_container_length_)));
    }
    return core::decode_ok();
}

// ---------------------------------------------------------------------------
// Scalars
// ---------------------------------------------------------------------------

core::DecodeResult Decoder::read_bool(const Descriptor& desc, bool& out) {
    if (desc.has_length || !wire::is_scalar_tag(desc.tag)) {
        return fail("value", not_scalar(desc, "bool"));
    }
    wire::Scalar scalar;
    auto r = fail("value", wire::read_scalar(reader_, desc.tag, scalar));
    if (!r.ok) return r;
    if (scalar.family != wire::Scalar::Family::Bool) {
        return fail("value", wrong_family(scalar.family, "bool"));
    }
    out = scalar.boolean;
    return r;
}

core::DecodeResult Decoder::read_signed(const Descriptor& desc, int64_t& out) {
    if (desc.has_length || !wire::is_scalar_tag(desc.tag)) {
        return fail("value", not_scalar(desc, "signed integer"));
    }
    wire::Scalar scalar;
    auto r = fail("value", wire::read_scalar(reader_, desc.tag, scalar));
    if (!r.ok) return r;
    switch (scalar.family) {
        case wire::Scalar::Family::Int:
            out = scalar.int_value;
            return r;
        case wire::Scalar::Family::Uint:
            if (scalar.uint_value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return out_of_range(std::to_string(scalar.uint_value), sizeof(int64_t));
            }
            out = static_cast<int64_t>(scalar.uint_value);
            return r;
        default:
            return fail("value", wrong_family(scalar.family, "signed integer"));
    }
}

core::DecodeResult Decoder::read_unsigned(const Descriptor& desc, uint64_t& out) {
    // The fixnum fallback for unsigned destinations covers 0x00..0x7f only.
    if (desc.has_length || !wire::is_scalar_tag(desc.tag) || wire::is_negative_fixnum(desc.tag)) {
        return fail("value", not_scalar(desc, "unsigned integer"));
    }
    wire::Scalar scalar;
    auto r = fail("value", wire::read_scalar(reader_, desc.tag, scalar));
    if (!r.ok) return r;
    switch (scalar.family) {
        case wire::Scalar::Family::Uint:
            out = scalar.uint_value;
            return r;
        case wire::Scalar::Family::Int:
            if (scalar.int_value < 0) {
                return out_of_range(std::to_string(scalar.int_value), sizeof(uint64_t));
            }
            out = static_cast<uint64_t>(scalar.int_value);
            return r;
        default:
            return fail("value", wrong_family(scalar.family, "unsigned integer"));
    }
}

core::DecodeResult Decoder::read_float(const Descriptor& desc, double& out) {
    if (desc.has_length || !wire::is_scalar_tag(desc.tag)) {
        return fail("value", not_scalar(desc, "float"));
    }
    wire::Scalar scalar;
    auto r = fail("value", wire::read_scalar(reader_, desc.tag, scalar));
    if (!r.ok) return r;
    if (scalar.family != wire::Scalar::Family::Float32 &&
        scalar.family != wire::Scalar::Family::Float64) {
        return fail("value", wrong_family(scalar.family, "float"));
    }
    out = scalar.float_value;
    return r;
}

core::DecodeResult Decoder::read_bytes(uint8_t* out, std::size_t length) {
    return fail("read", reader_.read_exact(out, length));
}

core::DecodeResult Decoder::out_of_range(const std::string& value, std::size_t width) {
    return fail("value", core::decode_error(core::ErrorKind::Type,
        "value " + value + " does not fit a " + std::to_string(width) + "-byte destination"));
}

core::DecodeResult Decoder::over_capacity(std::size_t length, std::size_t capacity) {
    return fail("value", core::decode_error(core::ErrorKind::Type,
        "fixed array of " + std::to_string(capacity) + " elements cannot hold " +
        std::to_string(length)));
}

core::DecodeResult Decoder::unknown_field(const std::string& name, const std::type_info& record) {
    return fail("record", core::decode_error(core::ErrorKind::Field,
        "no matching field for key \"" + name + "\" in " + record.name()));
}

// ---------------------------------------------------------------------------
// Open slots
// ---------------------------------------------------------------------------

core::DecodeResult Decoder::decode_open(value::Value& slot, const Descriptor& desc,
                                        const ParentContext& parent) {
    if (desc.tag == wire::kNil && !desc.has_length) {
        slot = value::Value();
        return core::decode_ok();
    }
    if (slot.is_record() && slot.as_record() != nullptr) {
        return dispatch(slot.as_record()->destination(), desc);
    }

    Descriptor resolved = desc;
    if (!resolved.has_length) {
        ProbeResult probe = probe_.probe(desc.tag, slot);
        if (!probe.status.ok) {
            return fail("value", std::move(probe.status));
        }
        if (probe.handled) {
            return probe.status;
        }
        resolved.has_length = true;
        resolved.container = probe.container;
        resolved.length = probe.length;
        auto r = check_length(resolved.length);
        if (!r.ok) return r;
    }

    slot = resolver_->resolve(parent, resolved.length, resolved.container);
    return decode_resolved(slot, resolved);
}

core::DecodeResult Decoder::decode_resolved(value::Value& slot, const Descriptor& desc) {
    using Kind = value::Value::Kind;
    using wire::ContainerType;

    switch (slot.kind()) {
        case Kind::Record:
            if (slot.as_record() != nullptr) {
                return dispatch(slot.as_record()->destination(), desc);
            }
            break;
        case Kind::String:
            if (desc.container == ContainerType::RawBytes) {
                return detail::Codec<std::string>::decode(*this, slot.as_string(), desc);
            }
            break;
        case Kind::Bytes:
            if (desc.container == ContainerType::RawBytes) {
                return detail::Codec<value::Value::Bytes>::decode(*this, slot.as_bytes(), desc);
            }
            break;
        case Kind::Sequence:
            if (desc.container == ContainerType::Sequence) {
                return detail::Codec<value::Value::Sequence>::decode(*this, slot.as_sequence(), desc);
            }
            break;
        case Kind::Map:
            if (desc.container == ContainerType::Map) {
                return detail::Codec<value::Value::Map>::decode(*this, slot.as_map(), desc);
            }
            break;
        default:
            break;
    }
    return fail("value", core::decode_error(core::ErrorKind::Type,
        std::string("resolver returned ") + value::Value::kind_name(slot.kind()) +
        " for " + wire::container_type_name(desc.container) + " of length " +
        std::to_string(desc.length)));
}

void Decoder::coerce_key(value::Value& key) {
    if (!key.is_bytes()) {
        return;
    }
    const auto& bytes = key.as_bytes();
    std::string text(bytes.begin(), bytes.end());
    if (diagnostics_ != nullptr) {
        diagnostics_->emit(core::Severity::Warning, core::config::kDiagnosticModule, "map-key",
            "raw byte map key coerced to string " + value::Value(text).to_string(),
            reader_.consumed());
    }
    key = value::Value(std::move(text));
}

}  // namespace msgdec::decode

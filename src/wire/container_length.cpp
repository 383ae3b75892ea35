#include <msgdec/wire/container_length.h>

#include <string>

namespace msgdec::wire {

core::DecodeResult read_container_length(io::ByteReader& reader, uint8_t tag,
                                         ContainerType type, std::size_t& length) {
    const ContainerDescriptor desc = container_descriptor(type);

    if (tag == desc.tag16) {
        uint16_t count = 0;
        auto r = reader.read_u16(count);
        if (!r.ok) return r;
        length = count;
        return r;
    }
    if (tag == desc.tag32) {
        uint32_t count = 0;
        auto r = reader.read_u32(count);
        if (!r.ok) return r;
        length = count;
        return r;
    }
    if ((tag & desc.inline_mask) == desc.inline_mask) {
        length = static_cast<std::size_t>(tag ^ desc.inline_mask);
        return core::decode_ok();
    }
    return core::decode_error(core::ErrorKind::Format,
        std::string("container length: unrecognized descriptor byte for ") +
        container_type_name(type) + ": " + describe_tag(tag));
}

}  // namespace msgdec::wire

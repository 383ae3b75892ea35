#include <msgdec/wire/format.h>

namespace msgdec::wire {

const char* container_type_name(ContainerType type) {
    switch (type) {
        case ContainerType::RawBytes: return "raw bytes";
        case ContainerType::Sequence: return "sequence";
        case ContainerType::Map:      return "map";
    }
    return "unknown";
}

std::optional<ContainerType> container_type_of(uint8_t tag) {
    if (tag == kRaw16 || tag == kRaw32 || (tag >= kFixRawMin && tag <= kFixRawMax)) {
        return ContainerType::RawBytes;
    }
    if (tag == kArray16 || tag == kArray32 || (tag >= kFixArrayMin && tag <= kFixArrayMax)) {
        return ContainerType::Sequence;
    }
    if (tag == kMap16 || tag == kMap32 || (tag >= kFixMapMin && tag <= kFixMapMax)) {
        return ContainerType::Map;
    }
    return std::nullopt;
}

bool is_scalar_tag(uint8_t tag) {
    switch (tag) {
        case kFalse:
        case kTrue:
        case kFloat32:
        case kFloat64:
        case kUint8:
        case kUint16:
        case kUint32:
        case kUint64:
        case kInt8:
        case kInt16:
        case kInt32:
        case kInt64:
            return true;
        default:
            return is_positive_fixnum(tag) || is_negative_fixnum(tag);
    }
}

bool is_recognized_tag(uint8_t tag) {
    return tag == kNil || is_scalar_tag(tag) || container_type_of(tag).has_value();
}

std::string describe_tag(uint8_t tag) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out = "0x";
    out += kHex[(tag >> 4) & 0x0F];
    out += kHex[tag & 0x0F];
    return out;
}

}  // namespace msgdec::wire

#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace msgdec::wire {

// Tag bytes. Every encoded value starts with one.
inline constexpr uint8_t kNil = 0xc0;
inline constexpr uint8_t kReserved = 0xc1;
inline constexpr uint8_t kFalse = 0xc2;
inline constexpr uint8_t kTrue = 0xc3;
inline constexpr uint8_t kFloat32 = 0xca;
inline constexpr uint8_t kFloat64 = 0xcb;
inline constexpr uint8_t kUint8 = 0xcc;
inline constexpr uint8_t kUint16 = 0xcd;
inline constexpr uint8_t kUint32 = 0xce;
inline constexpr uint8_t kUint64 = 0xcf;
inline constexpr uint8_t kInt8 = 0xd0;
inline constexpr uint8_t kInt16 = 0xd1;
inline constexpr uint8_t kInt32 = 0xd2;
inline constexpr uint8_t kInt64 = 0xd3;
inline constexpr uint8_t kRaw16 = 0xda;
inline constexpr uint8_t kRaw32 = 0xdb;
inline constexpr uint8_t kArray16 = 0xdc;
inline constexpr uint8_t kArray32 = 0xdd;
inline constexpr uint8_t kMap16 = 0xde;
inline constexpr uint8_t kMap32 = 0xdf;

inline constexpr uint8_t kPositiveFixnumMax = 0x7f;
inline constexpr uint8_t kNegativeFixnumMin = 0xe0;
inline constexpr uint8_t kFixMapMin = 0x80;
inline constexpr uint8_t kFixMapMax = 0x8f;
inline constexpr uint8_t kFixArrayMin = 0x90;
inline constexpr uint8_t kFixArrayMax = 0x9f;
inline constexpr uint8_t kFixRawMin = 0xa0;
inline constexpr uint8_t kFixRawMax = 0xbf;

enum class ContainerType {
    RawBytes,
    Sequence,
    Map,
};

const char* container_type_name(ContainerType type);

// Length encodings of one container category: inline count in the low bits
// of the tag, or a 16-bit / 32-bit big-endian count after it.
struct ContainerDescriptor {
    uint8_t inline_mask = 0;
    uint8_t tag16 = 0;
    uint8_t tag32 = 0;
};

constexpr ContainerDescriptor container_descriptor(ContainerType type) {
    switch (type) {
        case ContainerType::RawBytes: return {kFixRawMin, kRaw16, kRaw32};
        case ContainerType::Sequence: return {kFixArrayMin, kArray16, kArray32};
        case ContainerType::Map:      return {kFixMapMin, kMap16, kMap32};
    }
    return {};
}

constexpr bool is_positive_fixnum(uint8_t tag) { return tag <= kPositiveFixnumMax; }
constexpr bool is_negative_fixnum(uint8_t tag) { return tag >= kNegativeFixnumMin; }

// Category of a container tag, or nullopt for anything else.
std::optional<ContainerType> container_type_of(uint8_t tag);

// Bool, float, sized integer and fixnum tags.
bool is_scalar_tag(uint8_t tag);

// False for the reserved tag and for tags outside every range of this
// wire revision.
bool is_recognized_tag(uint8_t tag);

// "0xc1"
std::string describe_tag(uint8_t tag);

}  // namespace msgdec::wire

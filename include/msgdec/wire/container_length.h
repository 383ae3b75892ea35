#pragma once
#include <msgdec/core/error.h>
#include <msgdec/io/byte_reader.h>
#include <msgdec/wire/format.h>

#include <cstddef>
#include <cstdint>

namespace msgdec::wire {

// Element, byte or pair count for a container tag already read from the
// stream. Reads the 2- or 4-byte count that follows tag16/tag32; otherwise
// the count is the tag XOR the category's inline mask, provided every mask
// bit is set in the tag. Anything else is a format fault.
core::DecodeResult read_container_length(io::ByteReader& reader, uint8_t tag,
                                         ContainerType type, std::size_t& length);

}  // namespace msgdec::wire

#pragma once

#include <cstddef>
#include <cstdint>

namespace msgdec::core::config {

// Byte Reader scratch space, sliced into 1/2/4/8-byte views.
inline constexpr std::size_t kScratchBufferSize = 16;
// Additional reads issued after a short first read.
inline constexpr int kReadRetries = 1;

// Raw bytes decoded into an open slot become strings by default in every context.
inline constexpr bool kDefaultBytesAsStringTopLevel = true;
inline constexpr bool kDefaultBytesAsStringInSequence = true;
inline constexpr bool kDefaultBytesAsStringInMap = true;

// Largest element/byte/pair count accepted from a length prefix before
// anything is allocated for it.
inline constexpr std::size_t kDefaultMaxContainerLength = std::size_t{1} << 28;

// Sequences and raw bytes grow as elements arrive; a length prefix alone
// never reserves more than this many elements, and raw bytes are read in
// chunks of this size.
inline constexpr std::size_t kMaxPreallocatedElements = 1024;
inline constexpr std::size_t kRawReadChunk = 64 * 1024;

inline constexpr std::size_t kDefaultDiagnosticCapacity = 256;

inline constexpr const char kDiagnosticModule[] = "decoder";

inline constexpr const char kToolName[] = "msgdec_dump";
inline constexpr const char kVersionString[] = "msgdec_dump 0.1.0";

}  // namespace msgdec::core::config

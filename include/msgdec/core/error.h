#pragma once
#include <string>

namespace msgdec::core {

enum class ErrorKind {
    None,
    Read,    // I/O error or short read after the single retry
    Format,  // tag byte outside every recognized range, or reserved
    Type,    // wire shape incompatible with the destination's static kind
    Field,   // record key with no matching field
    Usage,   // destination is not a writable location
};

const char* error_kind_name(ErrorKind kind);

// Outcome of every decode step. The first non-ok result aborts the whole
// decode and is handed back to the caller unchanged.
struct DecodeResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string message;

    explicit operator bool() const { return ok; }
};

DecodeResult decode_ok();
DecodeResult decode_error(ErrorKind kind, std::string message);

std::string format_result(const DecodeResult& result);

}  // namespace msgdec::core

#include <msgdec/core/error.h>

#include <utility>

namespace msgdec::core {

namespace {

constexpr const char kMessageTag[] = "msgdec.decoder: ";

}  // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:   return "none";
        case ErrorKind::Read:   return "read";
        case ErrorKind::Format: return "format";
        case ErrorKind::Type:   return "type";
        case ErrorKind::Field:  return "field";
        case ErrorKind::Usage:  return "usage";
    }
    return "unknown";
}

DecodeResult decode_ok() {
    DecodeResult result;
    result.ok = true;
    return result;
}

DecodeResult decode_error(ErrorKind kind, std::string message) {
    DecodeResult result;
    result.ok = false;
    result.kind = kind;
    result.message = kMessageTag + std::move(message);
    return result;
}

std::string format_result(const DecodeResult& result) {
    if (result.ok) {
        return "[ok]";
    }
    return std::string("[") + error_kind_name(result.kind) + "] " + result.message;
}

}  // namespace msgdec::core

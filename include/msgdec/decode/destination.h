#pragma once
#include <msgdec/core/error.h>
#include <msgdec/wire/format.h>

#include <cstddef>
#include <cstdint>
#include <typeinfo>

namespace msgdec::decode {

class Decoder;

// A tag byte already taken off the stream, plus the container length when
// that has been read as well (the open-slot path reads it before the
// concrete destination exists).
struct Descriptor {
    uint8_t tag = 0;
    bool has_length = false;
    wire::ContainerType container = wire::ContainerType::RawBytes;
    std::size_t length = 0;
};

// Non-owning, type-erased reference to a writable slot. Created with
// Destination::of(&slot), which is defined alongside Decoder.
class Destination {
public:
    Destination() = default;

    template <typename T>
    static Destination of(T* target);

    bool valid() const { return target_ != nullptr && decode_ != nullptr; }
    const std::type_info& type() const { return type_ != nullptr ? *type_ : typeid(void); }

    template <typename T>
    T* get() const {
        if (target_ == nullptr || type_ == nullptr || *type_ != typeid(T)) {
            return nullptr;
        }
        return static_cast<T*>(target_);
    }

private:
    friend class Decoder;

    using DecodeFn = core::DecodeResult (*)(Decoder&, void*, const Descriptor&);

    Destination(void* target, const std::type_info* type, DecodeFn decode)
        : target_(target), type_(type), decode_(decode) {}

    void* target_ = nullptr;
    const std::type_info* type_ = nullptr;
    DecodeFn decode_ = nullptr;
};

}  // namespace msgdec::decode

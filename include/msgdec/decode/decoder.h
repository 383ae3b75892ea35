#pragma once
#include <msgdec/core/config.h>
#include <msgdec/core/diagnostics.h>
#include <msgdec/core/error.h>
#include <msgdec/decode/destination.h>
#include <msgdec/decode/dynamic_probe.h>
#include <msgdec/decode/field_map.h>
#include <msgdec/decode/resolver.h>
#include <msgdec/decode/traits.h>
#include <msgdec/io/byte_reader.h>
#include <msgdec/io/byte_source.h>
#include <msgdec/value/timestamp.h>
#include <msgdec/value/value.h>
#include <msgdec/wire/format.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace msgdec::decode {

struct DecoderOptions {
    // Null selects default_resolver().
    std::shared_ptr<const ContainerResolver> resolver;
    // Optional, not owned. Must outlive the decoder.
    core::DiagnosticEmitter* diagnostics = nullptr;
    std::size_t max_container_length = core::config::kDefaultMaxContainerLength;
};

namespace detail {
template <typename T>
struct Codec;
}  // namespace detail

// Type-directed decoder over one byte source. Each decode call reads exactly
// one value. The first fault aborts the call; writes already made to the
// destination are not rolled back. One instance serves one caller at a time.
class Decoder {
public:
    explicit Decoder(io::ByteSource& source,
                     std::shared_ptr<const ContainerResolver> resolver = nullptr);
    Decoder(io::ByteSource& source, DecoderOptions options);

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    // A null target is a usage fault; no byte is consumed.
    template <typename T>
    core::DecodeResult decode(T* target) {
        return decode_value(Destination::of(target));
    }

    core::DecodeResult decode_value(const Destination& destination);

    const ContainerResolver& resolver() const { return *resolver_; }
    std::uint64_t bytes_consumed() const { return reader_.consumed(); }
    std::uint64_t call_count() const { return calls_; }

private:
    template <typename T>
    friend struct detail::Codec;

    core::DecodeResult read_descriptor(Descriptor& desc);
    core::DecodeResult dispatch(const Destination& dest, const Descriptor& desc);
    // Reads the next tag byte and decodes into dest.
    core::DecodeResult decode_destination(const Destination& dest);

    template <typename T>
    core::DecodeResult decode_element(T& slot, const ParentContext& parent);

    // Fills desc.length for a container destination of the given type,
    // reading the length off the wire unless it is already known.
    core::DecodeResult container_length(Descriptor& desc, wire::ContainerType type);
    core::DecodeResult check_length(std::size_t length);

    core::DecodeResult read_bool(const Descriptor& desc, bool& out);
    core::DecodeResult read_signed(const Descriptor& desc, int64_t& out);
    core::DecodeResult read_unsigned(const Descriptor& desc, uint64_t& out);
    core::DecodeResult read_float(const Descriptor& desc, double& out);
    core::DecodeResult read_bytes(uint8_t* out, std::size_t length);

    core::DecodeResult out_of_range(const std::string& value, std::size_t width);
    core::DecodeResult over_capacity(std::size_t length, std::size_t capacity);
    core::DecodeResult unknown_field(const std::string& name, const std::type_info& record);

    core::DecodeResult decode_open(value::Value& slot, const Descriptor& desc,
                                   const ParentContext& parent);
    core::DecodeResult decode_resolved(value::Value& slot, const Descriptor& desc);
    void coerce_key(value::Value& key);

    core::DecodeResult fail(const char* stage, core::DecodeResult result);
    void finish(const core::DecodeResult& result);

    io::ByteReader reader_;
    DynamicProbe probe_;
    std::shared_ptr<const ContainerResolver> resolver_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    std::size_t max_container_length_;
    std::uint64_t calls_ = 0;
    std::uint64_t call_start_ = 0;
    const char* fault_stage_ = nullptr;
};

namespace detail {

// Key as the resolver sees it. Keys that are not scalars show up as nil.
template <typename K>
value::Value key_snapshot(const K& key) {
    if constexpr (std::is_same_v<K, value::Value> || std::is_same_v<K, std::string>) {
        return value::Value(key);
    } else if constexpr (std::is_same_v<K, bool> || std::is_integral_v<K> ||
                         std::is_same_v<K, float> || std::is_same_v<K, double>) {
        return value::Value(key);
    } else {
        return value::Value();
    }
}

template <typename T>
struct Codec {
    static core::DecodeResult decode(Decoder& dec, T& target, const Descriptor& desc) {
        if (desc.tag == wire::kNil && !desc.has_length) {
            reset(target);
            return core::decode_ok();
        }

        if constexpr (std::is_same_v<T, value::Value>) {
            return dec.decode_open(target, desc, ParentContext::none());
        } else if constexpr (is_pointer_like_v<T>) {
            return decode_pointee(dec, target, desc);
        } else if constexpr (std::is_same_v<T, value::Timestamp>) {
            return decode_timestamp(dec, target, desc);
        } else if constexpr (std::is_same_v<T, bool>) {
            return dec.read_bool(desc, target);
        } else if constexpr (std::is_integral_v<T>) {
            return decode_integer(dec, target, desc);
        } else if constexpr (std::is_floating_point_v<T>) {
            double v = 0.0;
            auto r = dec.read_float(desc, v);
            if (!r.ok) return r;
            target = static_cast<T>(v);
            return r;
        } else if constexpr (std::is_same_v<T, std::string> || is_byte_vector<T>::value) {
            return decode_raw(dec, target, desc);
        } else if constexpr (is_byte_array<T>::value) {
            return decode_raw_fixed(dec, target, desc);
        } else if constexpr (is_std_array<T>::value) {
            return decode_fixed(dec, target, desc);
        } else if constexpr (is_vector<T>::value) {
            return decode_sequence(dec, target, desc);
        } else if constexpr (is_map_like<T>::value) {
            return decode_map(dec, target, desc);
        } else if constexpr (is_record_v<T>) {
            return decode_record(dec, target, desc);
        } else {
            static_assert(dependent_false_v<T>, "unsupported destination type");
            return core::decode_ok();
        }
    }

    static void reset(T& target) {
        if constexpr (is_pointer_like_v<T>) {
            target.reset();
        } else if constexpr (std::is_same_v<T, std::string> || is_vector<T>::value ||
                             is_map_like<T>::value) {
            target.clear();
        } else {
            target = T{};
        }
    }

private:
    static core::DecodeResult decode_pointee(Decoder& dec, T& target, const Descriptor& desc) {
        if (!target) {
            if constexpr (is_unique_ptr<T>::value) {
                target = std::make_unique<typename T::element_type>();
            } else if constexpr (is_shared_ptr<T>::value) {
                target = std::make_shared<typename T::element_type>();
            } else {
                target.emplace();
            }
        }
        using Pointee = std::remove_cvref_t<decltype(*target)>;
        return Codec<Pointee>::decode(dec, *target, desc);
    }

    static core::DecodeResult decode_timestamp(Decoder& dec, T& target, const Descriptor& desc) {
        std::array<int64_t, 2> parts{};
        auto r = Codec<std::array<int64_t, 2>>::decode(dec, parts, desc);
        if (!r.ok) return r;
        if (!value::timestamp_representable(parts[0], parts[1])) {
            return dec.fail("value", core::decode_error(core::ErrorKind::Type,
                "timestamp out of range: " + std::to_string(parts[0]) + "s " +
                std::to_string(parts[1]) + "ns"));
        }
        target = value::make_timestamp(parts[0], parts[1]);
        return r;
    }

    static core::DecodeResult decode_integer(Decoder& dec, T& target, const Descriptor& desc) {
        if constexpr (std::is_signed_v<T>) {
            int64_t v = 0;
            auto r = dec.read_signed(desc, v);
            if (!r.ok) return r;
            if (v < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
                v > static_cast<int64_t>(std::numeric_limits<T>::max())) {
                return dec.out_of_range(std::to_string(v), sizeof(T));
            }
            target = static_cast<T>(v);
            return r;
        } else {
            uint64_t v = 0;
            auto r = dec.read_unsigned(desc, v);
            if (!r.ok) return r;
            if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                return dec.out_of_range(std::to_string(v), sizeof(T));
            }
            target = static_cast<T>(v);
            return r;
        }
    }

    // std::string and byte vectors. The bytes are taken verbatim.
    static core::DecodeResult decode_raw(Decoder& dec, T& target, const Descriptor& desc) {
        Descriptor d = desc;
        auto r = dec.container_length(d, wire::ContainerType::RawBytes);
        if (!r.ok || d.length == 0) return r;
        target.clear();
        while (target.size() < d.length) {
            const std::size_t offset = target.size();
            const std::size_t chunk = std::min(d.length - offset, core::config::kRawReadChunk);
            target.resize(offset + chunk);
            r = dec.read_bytes(reinterpret_cast<uint8_t*>(target.data()) + offset, chunk);
            if (!r.ok) return r;
        }
        return r;
    }

    static core::DecodeResult decode_raw_fixed(Decoder& dec, T& target, const Descriptor& desc) {
        Descriptor d = desc;
        auto r = dec.container_length(d, wire::ContainerType::RawBytes);
        if (!r.ok || d.length == 0) return r;
        if (d.length > target.size()) {
            return dec.over_capacity(d.length, target.size());
        }
        r = dec.read_bytes(target.data(), d.length);
        if (!r.ok) return r;
        std::fill(target.begin() + static_cast<std::ptrdiff_t>(d.length), target.end(), uint8_t{0});
        return r;
    }

    static core::DecodeResult decode_fixed(Decoder& dec, T& target, const Descriptor& desc) {
        Descriptor d = desc;
        auto r = dec.container_length(d, wire::ContainerType::Sequence);
        if (!r.ok || d.length == 0) return r;
        if (d.length > target.size()) {
            return dec.over_capacity(d.length, target.size());
        }
        const Destination self = Destination::of(&target);
        for (std::size_t i = 0; i < d.length; ++i) {
            r = dec.decode_element(target[i], ParentContext::sequence(self, i));
            if (!r.ok) return r;
        }
        for (std::size_t i = d.length; i < target.size(); ++i) {
            target[i] = typename T::value_type{};
        }
        return r;
    }

    static core::DecodeResult decode_sequence(Decoder& dec, T& target, const Descriptor& desc) {
        Descriptor d = desc;
        auto r = dec.container_length(d, wire::ContainerType::Sequence);
        if (!r.ok || d.length == 0) return r;
        if (target.size() > d.length) {
            target.resize(d.length);
        } else {
            target.reserve(std::min(d.length, core::config::kMaxPreallocatedElements));
        }
        const Destination self = Destination::of(&target);
        for (std::size_t i = 0; i < d.length; ++i) {
            if (i == target.size()) {
                target.emplace_back();
            }
            if constexpr (std::is_same_v<typename T::value_type, bool>) {
                bool element = target[i];
                r = dec.decode_element(element, ParentContext::sequence(self, i));
                target[i] = element;
            } else {
                r = dec.decode_element(target[i], ParentContext::sequence(self, i));
            }
            if (!r.ok) return r;
        }
        return r;
    }

    static core::DecodeResult decode_map(Decoder& dec, T& target, const Descriptor& desc) {
        using Key = typename T::key_type;
        using Mapped = typename T::mapped_type;

        Descriptor d = desc;
        auto r = dec.container_length(d, wire::ContainerType::Map);
        if (!r.ok || d.length == 0) return r;

        const Destination self = Destination::of(&target);
        for (std::size_t i = 0; i < d.length; ++i) {
            Key key{};
            r = dec.decode_element(key, ParentContext::none());
            if (!r.ok) return r;
            if constexpr (std::is_same_v<Key, value::Value>) {
                dec.coerce_key(key);
            }

            Mapped slot{};
            auto it = target.find(key);
            if (it != target.end()) {
                slot = std::move(it->second);
            }
            r = dec.decode_element(slot, ParentContext::map(self, key_snapshot(key)));
            target.insert_or_assign(std::move(key), std::move(slot));
            if (!r.ok) return r;
        }
        return r;
    }

    static core::DecodeResult decode_record(Decoder& dec, T& target, const Descriptor& desc) {
        Descriptor d = desc;
        auto r = dec.container_length(d, wire::ContainerType::Map);
        if (!r.ok || d.length == 0) return r;

        const FieldMap& fields = FieldRegistry::global().get<T>();
        for (std::size_t i = 0; i < d.length; ++i) {
            std::string name;
            r = dec.decode_element(name, ParentContext::none());
            if (!r.ok) return r;
            const FieldBinding* binding = fields.find(name);
            if (binding == nullptr) {
                return dec.unknown_field(name, typeid(T));
            }
            r = dec.decode_destination(binding->locate(&target));
            if (!r.ok) return r;
        }
        return r;
    }
};

template <typename T>
core::DecodeResult decode_thunk(Decoder& dec, void* target, const Descriptor& desc) {
    return Codec<T>::decode(dec, *static_cast<T*>(target), desc);
}

}  // namespace detail

template <typename T>
core::DecodeResult Decoder::decode_element(T& slot, const ParentContext& parent) {
    Descriptor desc;
    auto r = read_descriptor(desc);
    if (!r.ok) return r;
    if constexpr (std::is_same_v<T, value::Value>) {
        return decode_open(slot, desc, parent);
    } else {
        (void)parent;
        return detail::Codec<T>::decode(*this, slot, desc);
    }
}

template <typename T>
Destination Destination::of(T* target) {
    static_assert(!std::is_const_v<T>, "destination must be writable");
    if (target == nullptr) {
        return Destination();
    }
    return Destination(target, &typeid(T), &detail::decode_thunk<T>);
}

// Owned object of static type T inside a Value.
template <typename T>
class BoxedObject : public value::Boxed {
public:
    template <typename... Args>
    explicit BoxedObject(Args&&... args) : object_(std::forward<Args>(args)...) {}

    const std::type_info& type() const override { return typeid(T); }
    void* get() override { return &object_; }
    Destination destination() override { return Destination::of(&object_); }

    T& object() { return object_; }

private:
    T object_;
};

// Record Value holding a new T; decoding into it decodes into the T.
template <typename T, typename... Args>
value::Value box(Args&&... args) {
    value::Value::Record record = std::make_shared<BoxedObject<T>>(std::forward<Args>(args)...);
    return value::Value(std::move(record));
}

}  // namespace msgdec::decode

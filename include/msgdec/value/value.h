#pragma once
#include <msgdec/decode/destination.h>

#include <cstdint>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <variant>
#include <vector>

namespace msgdec::value {

// Owned object of a static type, held by a Value of kind Record. Decoding
// into such a Value decodes into the object with its static type.
class Boxed {
public:
    virtual ~Boxed() = default;
    virtual const std::type_info& type() const = 0;
    virtual void* get() = 0;
    virtual decode::Destination destination() = 0;
};

// Decoded value of an open destination.
class Value {
public:
    enum class Kind {
        Nil,
        Bool,
        Int,
        Uint,
        Float,
        String,
        Bytes,
        Sequence,
        Map,
        Record,
    };

    using Bytes = std::vector<uint8_t>;
    using Sequence = std::vector<Value>;
    using Map = std::map<Value, Value>;
    using Record = std::shared_ptr<Boxed>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : data_(value) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T value) {
        if constexpr (std::is_signed_v<T>) {
            data_ = static_cast<int64_t>(value);
        } else {
            data_ = static_cast<uint64_t>(value);
        }
    }

    Value(double value) : data_(value) {}
    Value(float value) : data_(static_cast<double>(value)) {}
    Value(const char* value) : data_(std::string(value)) {}
    Value(std::string value) : data_(std::move(value)) {}
    Value(std::string_view value) : data_(std::string(value)) {}
    Value(Bytes value) : data_(std::move(value)) {}
    Value(Sequence value) : data_(std::move(value)) {}
    Value(Map value) : data_(std::move(value)) {}
    Value(Record value) : data_(std::move(value)) {}

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    static const char* kind_name(Kind kind);

    bool is_nil() const { return kind() == Kind::Nil; }
    bool is_bool() const { return kind() == Kind::Bool; }
    bool is_int() const { return kind() == Kind::Int; }
    bool is_uint() const { return kind() == Kind::Uint; }
    bool is_float() const { return kind() == Kind::Float; }
    bool is_string() const { return kind() == Kind::String; }
    bool is_bytes() const { return kind() == Kind::Bytes; }
    bool is_sequence() const { return kind() == Kind::Sequence; }
    bool is_map() const { return kind() == Kind::Map; }
    bool is_record() const { return kind() == Kind::Record; }

    // Accessors throw std::bad_variant_access on a kind mismatch.
    bool as_bool() const { return std::get<bool>(data_); }
    int64_t as_int() const { return std::get<int64_t>(data_); }
    uint64_t as_uint() const { return std::get<uint64_t>(data_); }
    double as_float() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    std::string& as_string() { return std::get<std::string>(data_); }
    const Bytes& as_bytes() const { return std::get<Bytes>(data_); }
    Bytes& as_bytes() { return std::get<Bytes>(data_); }
    const Sequence& as_sequence() const { return std::get<Sequence>(data_); }
    Sequence& as_sequence() { return std::get<Sequence>(data_); }
    const Map& as_map() const { return std::get<Map>(data_); }
    Map& as_map() { return std::get<Map>(data_); }
    const Record& as_record() const { return std::get<Record>(data_); }

    // Boxed object of type T, or nullptr when this is not a Record of T.
    template <typename T>
    T* record_as() const {
        if (!is_record() || as_record() == nullptr || as_record()->type() != typeid(T)) {
            return nullptr;
        }
        return static_cast<T*>(as_record()->get());
    }

    // Compact JSON-like rendering; bytes print as hex.
    std::string to_string() const;

    friend bool operator==(const Value& lhs, const Value& rhs);
    friend bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }
    // Total order: kind first, then payload. Records order by identity.
    friend bool operator<(const Value& lhs, const Value& rhs);

private:
    std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string,
                 Bytes, Sequence, Map, Record> data_;
};

std::ostream& operator<<(std::ostream& os, const Value& value);

}  // namespace msgdec::value

#include <msgdec/value/value.h>

#include <cmath>
#include <functional>
#include <sstream>

namespace msgdec::value {

namespace {

// NaN sorts after every other double and equal to itself so that Float keys
// keep a strict weak order.
bool float_less(double lhs, double rhs) {
    if (std::isnan(lhs)) return false;
    if (std::isnan(rhs)) return true;
    return lhs < rhs;
}

bool float_equal(double lhs, double rhs) {
    if (std::isnan(lhs) || std::isnan(rhs)) {
        return std::isnan(lhs) && std::isnan(rhs);
    }
    return lhs == rhs;
}

void write_escaped(std::ostream& os, const std::string& text) {
    static constexpr char kHex[] = "0123456789abcdef";
    os << '"';
    for (char c : text) {
        auto byte = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            os << '\\' << c;
        } else if (byte < 0x20 || byte == 0x7f) {
            os << "\\x" << kHex[byte >> 4] << kHex[byte & 0x0F];
        } else {
            os << c;
        }
    }
    os << '"';
}

void write_value(std::ostream& os, const Value& value) {
    static constexpr char kHex[] = "0123456789abcdef";
    switch (value.kind()) {
        case Value::Kind::Nil:
            os << "nil";
            break;
        case Value::Kind::Bool:
            os << (value.as_bool() ? "true" : "false");
            break;
        case Value::Kind::Int:
            os << value.as_int();
            break;
        case Value::Kind::Uint:
            os << value.as_uint();
            break;
        case Value::Kind::Float: {
            std::ostringstream num;
            num.precision(17);
            num << value.as_float();
            os << num.str();
            break;
        }
        case Value::Kind::String:
            write_escaped(os, value.as_string());
            break;
        case Value::Kind::Bytes:
            os << "bytes(";
            for (uint8_t b : value.as_bytes()) {
                os << kHex[b >> 4] << kHex[b & 0x0F];
            }
            os << ")";
            break;
        case Value::Kind::Sequence: {
            os << "[";
            bool first = true;
            for (const auto& item : value.as_sequence()) {
                if (!first) os << ", ";
                first = false;
                write_value(os, item);
            }
            os << "]";
            break;
        }
        case Value::Kind::Map: {
            os << "{";
            bool first = true;
            for (const auto& [key, item] : value.as_map()) {
                if (!first) os << ", ";
                first = false;
                write_value(os, key);
                os << ": ";
                write_value(os, item);
            }
            os << "}";
            break;
        }
        case Value::Kind::Record:
            if (value.as_record() == nullptr) {
                os << "record(null)";
            } else {
                os << "record(" << value.as_record()->type().name() << ")";
            }
            break;
    }
}

}  // namespace

const char* Value::kind_name(Kind kind) {
    switch (kind) {
        case Kind::Nil:      return "nil";
        case Kind::Bool:     return "bool";
        case Kind::Int:      return "int";
        case Kind::Uint:     return "uint";
        case Kind::Float:    return "float";
        case Kind::String:   return "string";
        case Kind::Bytes:    return "bytes";
        case Kind::Sequence: return "sequence";
        case Kind::Map:      return "map";
        case Kind::Record:   return "record";
    }
    return "unknown";
}

std::string Value::to_string() const {
    std::ostringstream oss;
    write_value(oss, *this);
    return oss.str();
}

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    switch (lhs.kind()) {
        case Value::Kind::Nil:      return true;
        case Value::Kind::Bool:     return lhs.as_bool() == rhs.as_bool();
        case Value::Kind::Int:      return lhs.as_int() == rhs.as_int();
        case Value::Kind::Uint:     return lhs.as_uint() == rhs.as_uint();
        case Value::Kind::Float:    return float_equal(lhs.as_float(), rhs.as_float());
        case Value::Kind::String:   return lhs.as_string() == rhs.as_string();
        case Value::Kind::Bytes:    return lhs.as_bytes() == rhs.as_bytes();
        case Value::Kind::Sequence: {
            const auto& a = lhs.as_sequence();
            const auto& b = rhs.as_sequence();
            if (a.size() != b.size()) return false;
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!(a[i] == b[i])) return false;
            }
            return true;
        }
        case Value::Kind::Map: {
            const auto& a = lhs.as_map();
            const auto& b = rhs.as_map();
            if (a.size() != b.size()) return false;
            auto it = b.begin();
            for (const auto& [key, item] : a) {
                if (!(key == it->first) || !(item == it->second)) return false;
                ++it;
            }
            return true;
        }
        case Value::Kind::Record:   return lhs.as_record() == rhs.as_record();
    }
    return false;
}

bool operator<(const Value& lhs, const Value& rhs) {
    if (lhs.kind() != rhs.kind()) {
        return lhs.kind() < rhs.kind();
    }
    switch (lhs.kind()) {
        case Value::Kind::Nil:      return false;
        case Value::Kind::Bool:     return lhs.as_bool() < rhs.as_bool();
        case Value::Kind::Int:      return lhs.as_int() < rhs.as_int();
        case Value::Kind::Uint:     return lhs.as_uint() < rhs.as_uint();
        case Value::Kind::Float:    return float_less(lhs.as_float(), rhs.as_float());
        case Value::Kind::String:   return lhs.as_string() < rhs.as_string();
        case Value::Kind::Bytes:    return lhs.as_bytes() < rhs.as_bytes();
        case Value::Kind::Sequence: {
            const auto& a = lhs.as_sequence();
            const auto& b = rhs.as_sequence();
            std::size_t n = std::min(a.size(), b.size());
            for (std::size_t i = 0; i < n; ++i) {
                if (a[i] < b[i]) return true;
                if (b[i] < a[i]) return false;
            }
            return a.size() < b.size();
        }
        case Value::Kind::Map: {
            const auto& a = lhs.as_map();
            const auto& b = rhs.as_map();
            auto ia = a.begin();
            auto ib = b.begin();
            for (; ia != a.end() && ib != b.end(); ++ia, ++ib) {
                if (ia->first < ib->first) return true;
                if (ib->first < ia->first) return false;
                if (ia->second < ib->second) return true;
                if (ib->second < ia->second) return false;
            }
            return ia == a.end() && ib != b.end();
        }
        case Value::Kind::Record:
            return std::less<const Boxed*>()(lhs.as_record().get(), rhs.as_record().get());
    }
    return false;
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    write_value(os, value);
    return os;
}

}  // namespace msgdec::value

#pragma once
#include <msgdec/decode/destination.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace msgdec::decode {

// Records opt in by specializing RecordTraits:
//
//   template <> struct RecordTraits<Point> {
//       static void describe(FieldMapBuilder<Point>& fields) {
//           fields.field("x", &Point::x).field("y", &Point::y);
//       }
//   };
template <typename T>
struct RecordTraits {};

template <typename T>
class FieldMapBuilder;

template <typename T>
inline constexpr bool is_record_v = requires(FieldMapBuilder<T>& fields) {
    RecordTraits<T>::describe(fields);
};

struct FieldBinding {
    std::string name;
    // Slot of this field inside a record object of the mapped type.
    std::function<Destination(void* record)> locate;
};

class FieldMap {
public:
    // A later binding with the same name replaces the earlier one.
    void add(FieldBinding binding);

    const FieldBinding* find(std::string_view name) const;
    std::size_t size() const { return fields_.size(); }
    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, FieldBinding> fields_;
};

template <typename T>
class FieldMapBuilder {
public:
    explicit FieldMapBuilder(FieldMap& map) : map_(map) {}

    template <typename M>
    FieldMapBuilder& field(std::string name, M T::*member) {
        FieldBinding binding;
        binding.name = std::move(name);
        binding.locate = [member](void* record) {
            return Destination::of(&(static_cast<T*>(record)->*member));
        };
        map_.add(std::move(binding));
        return *this;
    }

private:
    FieldMap& map_;
};

// Wire-name-to-field maps keyed by record type. Each map is built on first
// use and never changes afterwards; lookups take a shared lock only.
class FieldRegistry {
public:
    FieldRegistry() = default;
    FieldRegistry(const FieldRegistry&) = delete;
    FieldRegistry& operator=(const FieldRegistry&) = delete;

    static FieldRegistry& global();

    template <typename T>
    const FieldMap& get() {
        static_assert(is_record_v<T>, "type has no RecordTraits specialization");
        const std::type_index key(typeid(T));
        {
            std::shared_lock lock(mutex_);
            auto it = maps_.find(key);
            if (it != maps_.end()) {
                return *it->second;
            }
        }

        auto built = std::make_unique<FieldMap>();
        FieldMapBuilder<T> builder(*built);
        RecordTraits<T>::describe(builder);

        std::unique_lock lock(mutex_);
        auto [it, inserted] = maps_.try_emplace(key, std::move(built));
        if (inserted) {
            ++builds_;
        }
        return *it->second;
    }

    std::size_t size() const;
    // Maps actually installed; racing first uses of one type count once.
    std::size_t build_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::unique_ptr<FieldMap>> maps_;
    std::size_t builds_ = 0;
};

}  // namespace msgdec::decode

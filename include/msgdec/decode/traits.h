#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace msgdec::decode {

template <typename T> struct is_unique_ptr : std::false_type {};
template <typename T> struct is_unique_ptr<std::unique_ptr<T>> : std::true_type {};

template <typename T> struct is_shared_ptr : std::false_type {};
template <typename T> struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename T> struct is_std_array : std::false_type {};
template <typename T, std::size_t N> struct is_std_array<std::array<T, N>> : std::true_type {};

template <typename T> struct is_byte_array : std::false_type {};
template <std::size_t N> struct is_byte_array<std::array<uint8_t, N>> : std::true_type {};

template <typename T> struct is_vector : std::false_type {};
template <typename T, typename A> struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T> struct is_byte_vector : std::false_type {};
template <typename A> struct is_byte_vector<std::vector<uint8_t, A>> : std::true_type {};

template <typename T> struct is_map_like : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_map_like<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct is_map_like<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T>
inline constexpr bool is_pointer_like_v =
    is_unique_ptr<T>::value || is_shared_ptr<T>::value || is_optional<T>::value;

template <typename T>
inline constexpr bool dependent_false_v = false;

}  // namespace msgdec::decode

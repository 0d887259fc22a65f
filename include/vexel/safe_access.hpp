#ifndef VEXEL_SAFE_ACCESS_HPP_
#define VEXEL_SAFE_ACCESS_HPP_

#include <vexel/types.hpp>

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <type_traits>

namespace vexel {

// ============================================================================
// Bounds-checked access
// ============================================================================
//
// Every index, length or key taken from file content goes through these
// helpers before it is trusted. Failures are out_of_bounds errors naming
// the offending index/range/key and the actual bound.

/**
 * Succeeds iff begin <= end <= length.
 */
[[nodiscard]] inline status check_range(std::size_t length, std::size_t begin, std::size_t end) {
    if (begin > end || end > length) {
        return failure(decode_error::out_of_bounds,
            "range " + std::to_string(begin) + ".." + std::to_string(end) +
            " out of bounds (length " + std::to_string(length) + ")");
    }
    return {};
}

/**
 * Element access; succeeds iff index < data.size().
 */
template <typename T>
[[nodiscard]] result<std::remove_const_t<T>> get_safe(std::span<T> data, std::size_t index) {
    if (index >= data.size()) {
        return failure(decode_error::out_of_bounds,
            "index " + std::to_string(index) + " out of bounds (length " +
            std::to_string(data.size()) + ")");
    }
    return data[index];
}

template <typename T, typename Alloc, template <typename, typename> class Container>
[[nodiscard]] result<T> get_safe(const Container<T, Alloc>& data, std::size_t index) {
    return get_safe(std::span<const T>(data.data(), data.size()), index);
}

/**
 * Sub-range access; succeeds iff begin <= end <= data.size().
 */
template <typename T>
[[nodiscard]] result<std::span<T>> get_range_safe(std::span<T> data, std::size_t begin, std::size_t end) {
    auto check = check_range(data.size(), begin, end);
    if (!check) {
        return check.error_info();
    }
    return data.subspan(begin, end - begin);
}

template <typename T, typename Alloc, template <typename, typename> class Container>
[[nodiscard]] result<std::span<const T>> get_range_safe(const Container<T, Alloc>& data,
                                                        std::size_t begin, std::size_t end) {
    return get_range_safe(std::span<const T>(data.data(), data.size()), begin, end);
}

namespace detail {

template <typename K>
std::string describe_key(const K& key) {
    if constexpr (std::is_integral_v<K> || std::is_enum_v<K>) {
        return std::to_string(static_cast<long long>(key));
    } else if constexpr (std::is_convertible_v<const K&, std::string>) {
        return "\"" + std::string(key) + "\"";
    } else {
        return "<key>";
    }
}

} // namespace detail

/**
 * Checked lookup on an associative container.
 */
template <typename Map>
[[nodiscard]] result<std::reference_wrapper<const typename Map::mapped_type>>
get_checked(const Map& map, const typename Map::key_type& key) {
    auto it = map.find(key);
    if (it == map.end()) {
        return failure(decode_error::out_of_bounds,
            "key " + detail::describe_key(key) + " not found (" +
            std::to_string(map.size()) + " entries)");
    }
    return std::cref(it->second);
}

} // namespace vexel

#endif // VEXEL_SAFE_ACCESS_HPP_

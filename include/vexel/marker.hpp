#ifndef VEXEL_MARKER_HPP_
#define VEXEL_MARKER_HPP_

#include <cstdint>
#include <optional>

namespace vexel {

// ============================================================================
// Marker Contract
// ============================================================================

/**
 * Numeric mapping for a closed set of 16-bit structural tags.
 *
 * Specialize for each marker enumeration:
 *
 *   template <> struct marker_traits<my_marker> {
 *       static std::optional<my_marker> from_u16(std::uint16_t value) noexcept;
 *       static std::uint16_t to_u16(my_marker m) noexcept;
 *   };
 *
 * from_u16 is partial (unknown values map to std::nullopt), to_u16 is total.
 * bit_reader::find_marker / next_marker are generic over this contract.
 */
template <typename Marker>
struct marker_traits;

template <typename Marker>
[[nodiscard]] std::optional<Marker> marker_from_u16(std::uint16_t value) noexcept {
    return marker_traits<Marker>::from_u16(value);
}

template <typename Marker>
[[nodiscard]] std::uint16_t marker_to_u16(Marker m) noexcept {
    return marker_traits<Marker>::to_u16(m);
}

} // namespace vexel

#endif // VEXEL_MARKER_HPP_

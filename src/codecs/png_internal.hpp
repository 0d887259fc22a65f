#pragma once

#include <vexel/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <vector>

namespace vexel::png_detail {

enum class filter_type : std::uint8_t {
    none = 0,
    sub = 1,
    up = 2,
    average = 3,
    paeth = 4
};

[[nodiscard]] constexpr std::uint8_t paeth_predictor(std::uint8_t a, std::uint8_t b, std::uint8_t c) noexcept {
    const int p = static_cast<int>(a) + static_cast<int>(b) - static_cast<int>(c);
    const int pa = std::abs(p - static_cast<int>(a));
    const int pb = std::abs(p - static_cast<int>(b));
    const int pc = std::abs(p - static_cast<int>(c));
    if (pa <= pb && pa <= pc) {
        return a;
    }
    return pb <= pc ? b : c;
}

/**
 * Reverse one scanline filter in place.
 * @param row Filtered bytes of the current row (without the filter byte)
 * @param prev Reconstructed previous row, or empty for the first row
 * @param bpp Bytes per complete pixel, at least 1
 */
[[nodiscard]] status unfilter_scanline(std::span<std::uint8_t> row, std::span<const std::uint8_t> prev,
                                       std::size_t bpp, std::uint8_t filter);

/**
 * Reverse filtering for a whole (sub)image of height rows.
 * @return Reconstructed rows of row_bytes each, filter bytes stripped
 */
[[nodiscard]] result<std::vector<std::uint8_t>> unfilter_image(std::span<const std::uint8_t> data,
                                                              std::size_t row_bytes,
                                                              std::size_t height,
                                                              std::size_t bpp);

/// Adam7 pass geometry.
struct adam7_pass {
    std::uint32_t x0;
    std::uint32_t y0;
    std::uint32_t dx;
    std::uint32_t dy;
};

inline constexpr std::array<adam7_pass, 7> adam7_passes = {{
    {0, 0, 8, 8},
    {4, 0, 8, 8},
    {0, 4, 4, 8},
    {2, 0, 4, 4},
    {0, 2, 2, 4},
    {1, 0, 2, 2},
    {0, 1, 1, 2},
}};

[[nodiscard]] constexpr std::uint32_t pass_extent(std::uint32_t size, std::uint32_t start,
                                                  std::uint32_t step) noexcept {
    return size > start ? (size - start + step - 1) / step : 0;
}

/// Filtered data size of a (possibly Adam7-interlaced) image, filter bytes included.
[[nodiscard]] std::size_t filtered_size(std::uint32_t width, std::uint32_t height, std::size_t bits_per_pixel,
                                        bool interlaced) noexcept;

} // namespace vexel::png_detail

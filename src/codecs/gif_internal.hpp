#pragma once

#include <vexel/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace vexel::gif_detail {

constexpr unsigned LZW_MAX_BITS = 12;
constexpr std::size_t LZW_TABLE_SIZE = 1u << LZW_MAX_BITS;

/**
 * Decode a GIF LZW stream (sub-block framing already removed).
 *
 * Produces at most pixel_count indices; a short stream is zero-padded
 * with a warning. Structural violations fail with invalid_data.
 */
[[nodiscard]] result<std::vector<std::uint8_t>> lzw_decode(std::span<const std::uint8_t> data,
                                                          unsigned min_code_size,
                                                          std::size_t pixel_count);

/**
 * Reorder rows stored in GIF interlace order (every 8th from 0, every 8th
 * from 4, every 4th from 2, every 2nd from 1) into top-to-bottom order.
 */
[[nodiscard]] std::vector<std::uint8_t> deinterlace(std::span<const std::uint8_t> rows,
                                                    std::size_t row_bytes,
                                                    std::size_t height);

} // namespace vexel::gif_detail

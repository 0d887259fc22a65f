#pragma once

#include <vexel/types.hpp>

#include <cstdint>
#include <cstddef>
#include <string>

namespace vexel {

// Limit applied when decode_options leaves a dimension limit at 0
constexpr std::uint32_t fallback_dimension_limit = 16384;

// Reject zero dimensions and dimensions above the configured limits
inline status validate_dimensions(std::uint32_t width, std::uint32_t height,
                                  const decode_options& options) {
    if (width == 0 || height == 0) {
        return failure(decode_error::invalid_dimensions,
            "invalid dimensions " + std::to_string(width) + "x" + std::to_string(height));
    }
    const std::uint32_t max_w = options.max_width > 0
        ? static_cast<std::uint32_t>(options.max_width) : fallback_dimension_limit;
    const std::uint32_t max_h = options.max_height > 0
        ? static_cast<std::uint32_t>(options.max_height) : fallback_dimension_limit;
    if (width > max_w || height > max_h) {
        return failure(decode_error::dimensions_exceeded,
            "image dimensions " + std::to_string(width) + "x" + std::to_string(height) +
            " exceed limits " + std::to_string(max_w) + "x" + std::to_string(max_h));
    }
    return {};
}

// Row stride calculation (4-byte aligned, for BMP)
inline std::size_t row_stride_4byte(std::uint32_t width, int bits_per_pixel) {
    return ((static_cast<std::size_t>(width) * static_cast<std::size_t>(bits_per_pixel) + 31) / 32) * 4;
}

// Extract pixel from packed data (1, 2, 4, or 8 bits per pixel), MSB first
inline std::uint8_t extract_pixel(const std::uint8_t* row, std::size_t x, int bits_per_pixel) {
    switch (bits_per_pixel) {
        case 1: {
            std::size_t byte_index = x / 8;
            int bit_index = 7 - static_cast<int>(x % 8);
            return (row[byte_index] >> bit_index) & 0x01;
        }
        case 2: {
            std::size_t byte_index = x / 4;
            int bit_index = 6 - static_cast<int>(x % 4) * 2;
            return (row[byte_index] >> bit_index) & 0x03;
        }
        case 4: {
            std::size_t byte_index = x / 2;
            int bit_index = (x % 2) ? 0 : 4;
            return (row[byte_index] >> bit_index) & 0x0F;
        }
        case 8:
            return row[x];
        default:
            return 0;
    }
}

// Scale a sample of the given bit depth to the full 8- or 16-bit range
inline std::uint8_t scale_to_8(std::uint32_t value, std::uint32_t max_value) {
    if (max_value == 255) {
        return static_cast<std::uint8_t>(value);
    }
    return static_cast<std::uint8_t>((static_cast<std::uint64_t>(value) * 255 + max_value / 2) / max_value);
}

inline std::uint16_t scale_to_16(std::uint32_t value, std::uint32_t max_value) {
    if (max_value == 65535) {
        return static_cast<std::uint16_t>(value);
    }
    return static_cast<std::uint16_t>((static_cast<std::uint64_t>(value) * 65535 + max_value / 2) / max_value);
}

} // namespace vexel

#pragma once

#include <cstddef>
#include <cstdint>

namespace vexel {

// Unaligned integer loads from raw file bytes. Callers check the range first.

template <typename T, std::size_t N = sizeof(T)>
constexpr T load_le(const std::uint8_t* p) noexcept {
    T v = 0;
    for (std::size_t i = N; i-- > 0;) {
        v = static_cast<T>((v << 8) | p[i]);
    }
    return v;
}

template <typename T, std::size_t N = sizeof(T)>
constexpr T load_be(const std::uint8_t* p) noexcept {
    T v = 0;
    for (std::size_t i = 0; i < N; ++i) {
        v = static_cast<T>((v << 8) | p[i]);
    }
    return v;
}

constexpr std::uint16_t read_le16(const std::uint8_t* p) noexcept { return load_le<std::uint16_t>(p); }
constexpr std::uint32_t read_le32(const std::uint8_t* p) noexcept { return load_le<std::uint32_t>(p); }
constexpr std::int32_t read_le32_signed(const std::uint8_t* p) noexcept {
    return static_cast<std::int32_t>(read_le32(p));
}

constexpr std::uint16_t read_be16(const std::uint8_t* p) noexcept { return load_be<std::uint16_t>(p); }
constexpr std::uint32_t read_be32(const std::uint8_t* p) noexcept { return load_be<std::uint32_t>(p); }

} // namespace vexel

#ifndef VEXEL_BIT_READER_HPP_
#define VEXEL_BIT_READER_HPP_

#include <vexel/vexel_export.h>
#include <vexel/byte_source.hpp>
#include <vexel/marker.hpp>
#include <vexel/types.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace vexel {

// ============================================================================
// Bit Reader
// ============================================================================

/**
 * Bit- and byte-level reader over an owned byte source.
 *
 * Bits are delivered most-significant first within each byte. At most one
 * partially consumed byte is buffered; after any bit read fewer than 8 bits
 * remain pending. Multi-byte reads are big-endian unless suffixed _le.
 */
class VEXEL_EXPORT bit_reader {
public:
    explicit bit_reader(std::unique_ptr<byte_source> source);
    explicit bit_reader(std::vector<std::uint8_t> data);
    explicit bit_reader(std::span<const std::uint8_t> data);

    bit_reader(bit_reader&&) noexcept = default;
    bit_reader& operator=(bit_reader&&) noexcept = default;

    [[nodiscard]] result<bool> read_bit();

    /**
     * Read n bits (n <= 32) MSB-first into an unsigned integer.
     */
    [[nodiscard]] result<std::uint32_t> read_bits(unsigned n);

    [[nodiscard]] result<std::uint8_t> read_u8();
    [[nodiscard]] result<std::uint16_t> read_u16();
    [[nodiscard]] result<std::uint16_t> read_u16_le();
    [[nodiscard]] result<std::uint32_t> read_u32();
    [[nodiscard]] result<std::uint32_t> read_u32_le();

    /**
     * Fill the whole buffer or fail with unexpected_eof.
     */
    [[nodiscard]] status read_bytes(std::span<std::uint8_t> buffer);
    [[nodiscard]] result<std::vector<std::uint8_t>> read_vector(std::size_t count);

    /**
     * Read count bytes without moving the cursor.
     */
    [[nodiscard]] result<std::vector<std::uint8_t>> peek_bytes(std::size_t count);

    /**
     * Drain the rest of the stream. Discards pending bits.
     */
    [[nodiscard]] result<std::vector<std::uint8_t>> read_to_end();

    [[nodiscard]] status skip(std::size_t count);
    [[nodiscard]] status seek(std::uint64_t position);

    /**
     * Discard pending bits and rewind to absolute position 0.
     */
    [[nodiscard]] status reset();

    /**
     * Discard a partially consumed byte without moving the cursor.
     */
    void clear_buffer() noexcept {
        bit_buffer_ = 0;
        bits_in_buffer_ = 0;
    }

    [[nodiscard]] unsigned bits_in_buffer() const noexcept { return bits_in_buffer_; }
    [[nodiscard]] std::uint64_t position() const noexcept { return source_->position(); }
    [[nodiscard]] std::uint64_t size() const noexcept { return source_->size(); }
    [[nodiscard]] std::uint64_t bytes_left() const noexcept {
        return source_->size() - source_->position();
    }

    /**
     * Scan forward for the big-endian 16-bit value of marker.
     * On success the cursor sits just past the marker. When the marker is not
     * found the cursor is restored to absolute position 0 and false returned.
     */
    template <typename Marker>
    [[nodiscard]] result<bool> find_marker(Marker marker);

    /**
     * Scan byte by byte for 0xFF followed by a byte that completes one of the
     * known markers. Returns std::nullopt at end of stream.
     *
     * A literal 0xFF data byte that happens to precede a marker-like byte is
     * reported as that marker; callers only scan between segments.
     */
    template <typename Marker>
    [[nodiscard]] result<std::optional<Marker>> next_marker(std::span<const Marker> known);

private:
    [[nodiscard]] result<std::uint8_t> read_byte();

    std::unique_ptr<byte_source> source_;
    std::uint8_t bit_buffer_ = 0;
    unsigned bits_in_buffer_ = 0;
};

// ============================================================================
// Marker search
// ============================================================================

template <typename Marker>
result<bool> bit_reader::find_marker(Marker marker) {
    const std::uint16_t target = marker_to_u16(marker);
    clear_buffer();

    auto first = read_byte();
    if (first) {
        std::uint8_t prev = first.value();
        for (;;) {
            auto next = read_byte();
            if (!next) {
                if (next.code() != decode_error::unexpected_eof) {
                    return next.error_info();
                }
                break;
            }
            const std::uint16_t window = static_cast<std::uint16_t>((prev << 8) | next.value());
            if (window == target) {
                return true;
            }
            prev = next.value();
        }
    } else if (first.code() != decode_error::unexpected_eof) {
        return first.error_info();
    }

    auto rewind = reset();
    if (!rewind) {
        return rewind.error_info();
    }
    return false;
}

template <typename Marker>
result<std::optional<Marker>> bit_reader::next_marker(std::span<const Marker> known) {
    clear_buffer();

    bool prev_is_escape = false;
    for (;;) {
        auto byte = read_byte();
        if (!byte) {
            if (byte.code() == decode_error::unexpected_eof) {
                return std::optional<Marker>{};
            }
            return byte.error_info();
        }

        if (prev_is_escape) {
            const auto value = static_cast<std::uint16_t>(0xFF00 | byte.value());
            for (const Marker& m : known) {
                if (marker_to_u16(m) == value) {
                    return std::optional<Marker>{m};
                }
            }
        }
        prev_is_escape = byte.value() == 0xFF;
    }
}

} // namespace vexel

#endif // VEXEL_BIT_READER_HPP_

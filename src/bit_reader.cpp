#include <vexel/bit_reader.hpp>

#include <string>

namespace vexel {

bit_reader::bit_reader(std::unique_ptr<byte_source> source)
    : source_(std::move(source)) {}

bit_reader::bit_reader(std::vector<std::uint8_t> data)
    : source_(std::make_unique<memory_source>(std::move(data))) {}

bit_reader::bit_reader(std::span<const std::uint8_t> data)
    : source_(std::make_unique<memory_source>(data)) {}

result<std::uint8_t> bit_reader::read_byte() {
    std::uint8_t byte = 0;
    auto got = source_->read(std::span<std::uint8_t>(&byte, 1));
    if (!got) {
        return got.error_info();
    }
    if (got.value() == 0) {
        return failure(decode_error::unexpected_eof,
            "unexpected end of stream at offset " + std::to_string(source_->position()));
    }
    return byte;
}

result<bool> bit_reader::read_bit() {
    if (bits_in_buffer_ == 0) {
        auto byte = read_byte();
        if (!byte) {
            return byte.error_info();
        }
        bit_buffer_ = byte.value();
        bits_in_buffer_ = 8;
    }

    const bool bit = (bit_buffer_ & 0x80) != 0;
    bit_buffer_ = static_cast<std::uint8_t>(bit_buffer_ << 1);
    --bits_in_buffer_;
    return bit;
}

result<std::uint32_t> bit_reader::read_bits(unsigned n) {
    std::uint32_t value = 0;
    for (unsigned i = 0; i < n; ++i) {
        auto bit = read_bit();
        if (!bit) {
            return bit.error_info();
        }
        value = (value << 1) | (bit.value() ? 1u : 0u);
    }
    return value;
}

result<std::uint8_t> bit_reader::read_u8() {
    if (bits_in_buffer_ == 0) {
        return read_byte();
    }
    auto bits = read_bits(8);
    if (!bits) {
        return bits.error_info();
    }
    return static_cast<std::uint8_t>(bits.value());
}

result<std::uint16_t> bit_reader::read_u16() {
    auto hi = read_u8();
    if (!hi) {
        return hi.error_info();
    }
    auto lo = read_u8();
    if (!lo) {
        return lo.error_info();
    }
    return static_cast<std::uint16_t>((hi.value() << 8) | lo.value());
}

result<std::uint16_t> bit_reader::read_u16_le() {
    auto v = read_u16();
    if (!v) {
        return v;
    }
    const std::uint16_t be = v.value();
    return static_cast<std::uint16_t>((be >> 8) | (be << 8));
}

result<std::uint32_t> bit_reader::read_u32() {
    auto hi = read_u16();
    if (!hi) {
        return hi.error_info();
    }
    auto lo = read_u16();
    if (!lo) {
        return lo.error_info();
    }
    return (static_cast<std::uint32_t>(hi.value()) << 16) | lo.value();
}

result<std::uint32_t> bit_reader::read_u32_le() {
    auto lo = read_u16_le();
    if (!lo) {
        return lo.error_info();
    }
    auto hi = read_u16_le();
    if (!hi) {
        return hi.error_info();
    }
    return (static_cast<std::uint32_t>(hi.value()) << 16) | lo.value();
}

status bit_reader::read_bytes(std::span<std::uint8_t> buffer) {
    if (bits_in_buffer_ != 0) {
        for (auto& b : buffer) {
            auto v = read_u8();
            if (!v) {
                return v.error_info();
            }
            b = v.value();
        }
        return {};
    }

    std::size_t filled = 0;
    while (filled < buffer.size()) {
        auto got = source_->read(buffer.subspan(filled));
        if (!got) {
            return got.error_info();
        }
        if (got.value() == 0) {
            return failure(decode_error::unexpected_eof,
                "unexpected end of stream: needed " + std::to_string(buffer.size()) +
                " bytes, got " + std::to_string(filled));
        }
        filled += got.value();
    }
    return {};
}

result<std::vector<std::uint8_t>> bit_reader::read_vector(std::size_t count) {
    if (count > bytes_left()) {
        return failure(decode_error::unexpected_eof,
            "unexpected end of stream: needed " + std::to_string(count) +
            " bytes, " + std::to_string(bytes_left()) + " left");
    }
    std::vector<std::uint8_t> out(count);
    auto st = read_bytes(out);
    if (!st) {
        return st.error_info();
    }
    return out;
}

result<std::vector<std::uint8_t>> bit_reader::peek_bytes(std::size_t count) {
    const std::uint64_t start = position();
    const unsigned saved_bits = bits_in_buffer_;
    const std::uint8_t saved_buffer = bit_buffer_;

    clear_buffer();
    auto bytes = read_vector(count);
    auto back = source_->seek(start);
    if (!back) {
        return back.error_info();
    }
    bits_in_buffer_ = saved_bits;
    bit_buffer_ = saved_buffer;
    return bytes;
}

result<std::vector<std::uint8_t>> bit_reader::read_to_end() {
    clear_buffer();
    return read_vector(static_cast<std::size_t>(bytes_left()));
}

status bit_reader::skip(std::size_t count) {
    if (count > bytes_left()) {
        return failure(decode_error::unexpected_eof,
            "cannot skip " + std::to_string(count) + " bytes, " +
            std::to_string(bytes_left()) + " left");
    }
    return seek(position() + count);
}

status bit_reader::seek(std::uint64_t position) {
    clear_buffer();
    return source_->seek(position);
}

status bit_reader::reset() {
    clear_buffer();
    return source_->seek(0);
}

} // namespace vexel

#ifndef VEXEL_CODECS_STUB_HPP_
#define VEXEL_CODECS_STUB_HPP_

#include <vexel/vexel_export.h>
#include <vexel/bit_reader.hpp>
#include <vexel/decoder.hpp>
#include <vexel/types.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace vexel {

// ============================================================================
// Recognized but not decoded formats
// ============================================================================

/// What is known about a WebP or AVIF file without decoding it.
struct stub_info {
    image_format format = image_format::unknown;
    std::string container;   // "RIFF" or "ISOBMFF"
    std::string brand;       // first WebP chunk ("VP8 ", "VP8L", "VP8X") or AVIF ftyp brand
    std::uint64_t file_size = 0;
};

/**
 * WebP files are recognized by their RIFF....WEBP signature.
 * decode() always fails with not_implemented.
 */
class VEXEL_EXPORT webp_decoder : public image_decoder {
public:
    static constexpr std::string_view name = "webp";
    static constexpr std::string_view extensions[] = {".webp"};

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    explicit webp_decoder(std::unique_ptr<byte_source> source, const decode_options& options = {});

    [[nodiscard]] image_format format() const noexcept override { return image_format::webp; }
    [[nodiscard]] result<image> decode() override;
    [[nodiscard]] image_info get_image_info() override;

private:
    bit_reader reader_;
};

/**
 * AVIF files are recognized by an ftyp box with an avif or avis brand.
 * decode() always fails with not_implemented.
 */
class VEXEL_EXPORT avif_decoder : public image_decoder {
public:
    static constexpr std::string_view name = "avif";
    static constexpr std::string_view extensions[] = {".avif", ".avifs"};

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    explicit avif_decoder(std::unique_ptr<byte_source> source, const decode_options& options = {});

    [[nodiscard]] image_format format() const noexcept override { return image_format::avif; }
    [[nodiscard]] result<image> decode() override;
    [[nodiscard]] image_info get_image_info() override;

private:
    bit_reader reader_;
};

} // namespace vexel

#endif // VEXEL_CODECS_STUB_HPP_

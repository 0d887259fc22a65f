#ifndef VEXEL_CODECS_BMP_HPP_
#define VEXEL_CODECS_BMP_HPP_

#include <vexel/vexel_export.h>
#include <vexel/bit_reader.hpp>
#include <vexel/decoder.hpp>
#include <vexel/types.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vexel {

// ============================================================================
// BMP Metadata
// ============================================================================

enum class bmp_compression : std::uint32_t {
    rgb = 0,
    rle8 = 1,
    rle4 = 2,
    bitfields = 3,
    jpeg = 4,
    png = 5,
    alpha_bitfields = 6
};

[[nodiscard]] VEXEL_EXPORT const char* to_string(bmp_compression compression) noexcept;

struct bmp_color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

struct bmp_info {
    // File header
    std::string signature;  // "BM", "BA", "CI", "CP", "IC" or "PT"
    std::uint32_t file_size = 0;
    std::uint32_t data_offset = 0;

    // DIB header
    std::uint32_t header_size = 0;
    std::int32_t width = 0;
    std::int32_t height = 0;  // negative = top-down
    std::uint16_t planes = 0;
    std::uint16_t bits_per_pixel = 0;
    bmp_compression compression = bmp_compression::rgb;
    std::uint32_t image_size = 0;
    std::int32_t x_pixels_per_meter = 0;
    std::int32_t y_pixels_per_meter = 0;
    std::uint32_t colors_used = 0;
    std::uint32_t colors_important = 0;

    std::uint32_t red_mask = 0;
    std::uint32_t green_mask = 0;
    std::uint32_t blue_mask = 0;
    std::uint32_t alpha_mask = 0;

    std::vector<bmp_color> color_table;

    [[nodiscard]] bool top_down() const noexcept { return height < 0; }
};

// ============================================================================
// BMP Decoder
// ============================================================================

class VEXEL_EXPORT bmp_decoder : public image_decoder {
public:
    static constexpr std::string_view name = "bmp";
    static constexpr std::string_view extensions[] = {".bmp", ".dib"};

    /**
     * Check if data starts with one of the BMP/OS2 signatures.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    explicit bmp_decoder(std::unique_ptr<byte_source> source, const decode_options& options = {});

    [[nodiscard]] image_format format() const noexcept override { return image_format::bmp; }

    /**
     * Decode BMP image data.
     * Supports:
     *   - Windows BMP (BITMAPINFOHEADER and V2..V5)
     *   - OS/2 BMP (BITMAPCOREHEADER and OS/2 2.x)
     *   - 1, 2, 4, 8, 16, 24, and 32-bit color depths
     *   - RLE4 and RLE8 compression
     *   - BI_BITFIELDS and BI_ALPHABITFIELDS for 16-bit and 32-bit images
     *   - Top-down and bottom-up images
     */
    [[nodiscard]] result<image> decode() override;

    [[nodiscard]] image_info get_image_info() override;

    [[nodiscard]] const bmp_info& info() const noexcept { return info_; }

private:
    [[nodiscard]] status read_file();

    bit_reader reader_;
    decode_options options_;
    bmp_info info_;
    std::vector<std::uint8_t> data_;
    bool headers_parsed_ = false;
};

} // namespace vexel

#endif // VEXEL_CODECS_BMP_HPP_

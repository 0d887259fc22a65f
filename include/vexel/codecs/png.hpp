#ifndef VEXEL_CODECS_PNG_HPP_
#define VEXEL_CODECS_PNG_HPP_

#include <vexel/vexel_export.h>
#include <vexel/bit_reader.hpp>
#include <vexel/decoder.hpp>
#include <vexel/types.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vexel {

// ============================================================================
// PNG Metadata
// ============================================================================

enum class png_color_type : std::uint8_t {
    grayscale = 0,
    rgb = 2,
    indexed = 3,
    grayscale_alpha = 4,
    rgba = 6
};

[[nodiscard]] VEXEL_EXPORT const char* to_string(png_color_type type) noexcept;

struct png_palette_entry {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

struct png_chromaticities {
    double white_x = 0.0;
    double white_y = 0.0;
    double red_x = 0.0;
    double red_y = 0.0;
    double green_x = 0.0;
    double green_y = 0.0;
    double blue_x = 0.0;
    double blue_y = 0.0;
};

struct png_physical_dimensions {
    std::uint32_t x_pixels_per_unit = 0;
    std::uint32_t y_pixels_per_unit = 0;
    std::uint8_t unit = 0;  // 0 = unknown, 1 = metre
};

struct png_time {
    std::uint16_t year = 0;
    std::uint8_t month = 0;
    std::uint8_t day = 0;
    std::uint8_t hour = 0;
    std::uint8_t minute = 0;
    std::uint8_t second = 0;
};

struct png_suggested_palette {
    std::string name;
    std::uint8_t sample_depth = 8;
    std::size_t entries = 0;
};

/// tEXt, zTXt and iTXt chunks. zTXt and compressed iTXt are inflated.
struct png_text {
    std::string keyword;
    std::string text;
    std::string language;            // iTXt only
    std::string translated_keyword;  // iTXt only
    bool compressed = false;
    bool international = false;
};

struct png_iccp {
    std::string name;
    std::size_t compressed_size = 0;
};

struct png_animation_control {
    std::uint32_t num_frames = 0;
    std::uint32_t num_plays = 0;  // 0 = infinite
};

struct png_frame_control {
    std::uint32_t sequence_number = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t x_offset = 0;
    std::uint32_t y_offset = 0;
    std::uint16_t delay_num = 0;
    std::uint16_t delay_den = 0;
    std::uint8_t dispose_op = 0;
    std::uint8_t blend_op = 0;
};

struct png_info {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint8_t bit_depth = 0;
    png_color_type color_type = png_color_type::grayscale;
    std::uint8_t compression_method = 0;
    std::uint8_t filter_method = 0;
    std::uint8_t interlace_method = 0;

    std::vector<png_palette_entry> palette;
    std::vector<std::uint8_t> palette_alpha;         // tRNS, indexed
    std::optional<std::array<std::uint16_t, 3>> transparent_color;  // tRNS, gray uses [0]
    std::optional<double> gamma;
    std::optional<png_chromaticities> chromaticities;
    std::optional<std::uint8_t> srgb_intent;
    std::optional<png_iccp> icc_profile;
    std::optional<std::array<std::uint16_t, 3>> background;  // gray uses [0], indexed [0] = index
    std::vector<png_suggested_palette> suggested_palettes;
    std::optional<png_physical_dimensions> physical;
    std::vector<std::uint8_t> significant_bits;
    std::vector<std::uint16_t> histogram;
    std::optional<png_time> last_modified;
    std::vector<png_text> text;

    std::optional<png_animation_control> animation;
    std::vector<png_frame_control> frames;

    std::vector<std::string> chunks;  // chunk types in stream order
};

// ============================================================================
// PNG Decoder
// ============================================================================

class VEXEL_EXPORT png_decoder : public image_decoder {
public:
    static constexpr std::string_view name = "png";
    static constexpr std::string_view extensions[] = {".png", ".apng"};

    /**
     * Check if data starts with the 8-byte PNG signature.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    explicit png_decoder(std::unique_ptr<byte_source> source, const decode_options& options = {});

    [[nodiscard]] image_format format() const noexcept override { return image_format::png; }

    /**
     * Decode a PNG or APNG stream.
     * Supports all standard color types and bit depths, Adam7 interlacing
     * and tRNS transparency. APNG frames are exposed through image::frames().
     */
    [[nodiscard]] result<image> decode() override;

    [[nodiscard]] image_info get_image_info() override;

    [[nodiscard]] const png_info& info() const noexcept { return info_; }

private:
    [[nodiscard]] status read_chunks(bool headers_only);

    bit_reader reader_;
    decode_options options_;
    png_info info_;
    std::vector<std::uint8_t> idat_;
    // fdAT data per fcTL, in order; the default image may be frame 0
    std::vector<std::vector<std::uint8_t>> frame_data_;
    bool default_image_is_frame_ = false;
    bool headers_parsed_ = false;
};

} // namespace vexel

#endif // VEXEL_CODECS_PNG_HPP_

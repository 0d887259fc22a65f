#ifndef VEXEL_CODECS_GIF_HPP_
#define VEXEL_CODECS_GIF_HPP_

#include <vexel/vexel_export.h>
#include <vexel/bit_reader.hpp>
#include <vexel/decoder.hpp>
#include <vexel/types.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vexel {

// ============================================================================
// GIF Metadata
// ============================================================================

/// Graphic control disposal method as stored in the file (values 4..7 are reserved).
enum class gif_disposal : std::uint8_t {
    unspecified = 0,
    keep = 1,
    background = 2,
    previous = 3
};

[[nodiscard]] VEXEL_EXPORT const char* to_string(gif_disposal disposal) noexcept;

struct gif_application_extension {
    std::string identifier;  // 8 bytes, e.g. "NETSCAPE"
    std::string auth_code;   // 3 bytes, e.g. "2.0"
    std::optional<std::uint16_t> loop_count;   // NETSCAPE2.0 sub-block 1, 0 = forever
    std::optional<std::uint32_t> buffer_size;  // NETSCAPE2.0 sub-block 2
    std::vector<std::uint8_t> data;            // other applications
};

struct gif_plain_text_extension {
    std::uint16_t left = 0;
    std::uint16_t top = 0;
    std::uint16_t width = 0;
    std::uint16_t height = 0;
    std::uint8_t cell_width = 0;
    std::uint8_t cell_height = 0;
    std::uint8_t foreground_color = 0;
    std::uint8_t background_color = 0;
    std::string text;
};

struct gif_frame_info {
    std::uint16_t left = 0;
    std::uint16_t top = 0;
    std::uint16_t width = 0;
    std::uint16_t height = 0;
    bool local_color_table_flag = false;
    bool interlaced = false;
    bool sort_flag = false;
    std::size_t local_color_table_size = 0;  // entries
    std::vector<std::uint8_t> local_color_table;  // RGB triples
    std::uint8_t lzw_minimum_code_size = 0;
    std::size_t data_length = 0;  // compressed bytes without sub-block framing

    // Graphic control extension preceding the image descriptor
    bool has_graphic_control = false;
    gif_disposal disposal = gif_disposal::unspecified;
    bool user_input = false;
    std::optional<std::uint8_t> transparent_index;
    std::uint32_t delay_ms = 0;
};

struct gif_info {
    std::string version;  // "87a" or "89a"
    std::uint16_t canvas_width = 0;
    std::uint16_t canvas_height = 0;
    bool global_color_table_flag = false;
    std::uint8_t color_resolution = 0;  // bits per primary minus one
    bool sort_flag = false;
    std::size_t global_color_table_size = 0;  // entries
    std::vector<std::uint8_t> global_color_table;  // RGB triples
    std::uint8_t background_color_index = 0;
    std::uint8_t pixel_aspect_ratio = 0;

    std::vector<gif_frame_info> frames;
    std::vector<std::string> comments;
    std::vector<gif_application_extension> app_extensions;
    std::vector<gif_plain_text_extension> plain_text_extensions;
};

// ============================================================================
// GIF Decoder
// ============================================================================

class VEXEL_EXPORT gif_decoder : public image_decoder {
public:
    static constexpr std::string_view name = "gif";
    static constexpr std::string_view extensions[] = {".gif"};

    /**
     * Check for a "GIF87a" or "GIF89a" header.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    explicit gif_decoder(std::unique_ptr<byte_source> source, const decode_options& options = {});

    [[nodiscard]] image_format format() const noexcept override { return image_format::gif; }

    /**
     * Decode all frames.
     * The returned image is the canvas (RGBA8) with the first frame placed
     * at its offset over transparent black. Every frame is exposed through
     * image::frames() with its own region; no compositing is performed.
     */
    [[nodiscard]] result<image> decode() override;

    [[nodiscard]] image_info get_image_info() override;

    [[nodiscard]] const gif_info& info() const noexcept { return info_; }

private:
    [[nodiscard]] status read_stream();
    [[nodiscard]] status read_header();
    [[nodiscard]] status read_image_descriptor(std::optional<gif_frame_info> control);
    [[nodiscard]] status read_extension(std::optional<gif_frame_info>& control);
    [[nodiscard]] result<std::vector<std::uint8_t>> decode_frame(std::size_t index, std::uint32_t canvas_width,
                                                                   std::uint32_t canvas_height) const;

    bit_reader reader_;
    decode_options options_;
    gif_info info_;
    std::vector<std::vector<std::uint8_t>> frame_data_;
    bool headers_parsed_ = false;
};

} // namespace vexel

#endif // VEXEL_CODECS_GIF_HPP_

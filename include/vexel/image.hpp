#ifndef VEXEL_IMAGE_HPP_
#define VEXEL_IMAGE_HPP_

#include <vexel/vexel_export.h>
#include <vexel/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace vexel {

// ============================================================================
// Pixel Formats
// ============================================================================

enum class pixel_format {
    l8,      // 8-bit luminance
    la8,     // 8-bit luminance + alpha
    l16,     // 16-bit luminance
    la16,    // 16-bit luminance + alpha
    rgb8,    // 24-bit RGB
    rgba8,   // 32-bit RGBA
    rgb16,   // 48-bit RGB
    rgba16   // 64-bit RGBA
};

[[nodiscard]] constexpr std::size_t channel_count(pixel_format fmt) noexcept {
    switch (fmt) {
        case pixel_format::l8:
        case pixel_format::l16:    return 1;
        case pixel_format::la8:
        case pixel_format::la16:   return 2;
        case pixel_format::rgb8:
        case pixel_format::rgb16:  return 3;
        case pixel_format::rgba8:
        case pixel_format::rgba16: return 4;
    }
    return 0;
}

[[nodiscard]] constexpr bool is_16bit(pixel_format fmt) noexcept {
    return fmt == pixel_format::l16 || fmt == pixel_format::la16 ||
           fmt == pixel_format::rgb16 || fmt == pixel_format::rgba16;
}

[[nodiscard]] constexpr bool has_alpha(pixel_format fmt) noexcept {
    return fmt == pixel_format::la8 || fmt == pixel_format::la16 ||
           fmt == pixel_format::rgba8 || fmt == pixel_format::rgba16;
}

[[nodiscard]] VEXEL_EXPORT const char* to_string(pixel_format fmt) noexcept;

// ============================================================================
// Animation Frames
// ============================================================================

enum class frame_dispose {
    none,        // leave the canvas as is
    background,  // clear the frame region
    previous     // restore the canvas to its state before the frame
};

enum class frame_blend {
    source,  // overwrite the region
    over     // alpha-composite over the region
};

/**
 * One animation frame, not composited.
 * Pixels cover only the frame region, as packed RGBA8.
 */
struct image_frame {
    std::uint32_t left = 0;
    std::uint32_t top = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t delay_ms = 0;
    frame_dispose dispose = frame_dispose::none;
    frame_blend blend = frame_blend::over;
    std::vector<std::uint8_t> rgba;
};

// ============================================================================
// Image
// ============================================================================

/**
 * Decoded image: dimensions plus pixels in one of the pixel formats.
 *
 * 8-bit formats keep their samples in pixels8(), 16-bit formats in
 * pixels16(); 16-bit samples use the full 0..65535 range.
 * A constructed image always satisfies
 * samples == width * height * channel_count(format) with nonzero dimensions.
 */
class VEXEL_EXPORT image {
public:
    image() = default;

    [[nodiscard]] static result<image> from_pixels(std::uint32_t width, std::uint32_t height,
                                                   pixel_format format,
                                                   std::vector<std::uint8_t> pixels);

    [[nodiscard]] static result<image> from_pixels16(std::uint32_t width, std::uint32_t height,
                                                     pixel_format format,
                                                     std::vector<std::uint16_t> pixels);

    [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
    [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
    [[nodiscard]] pixel_format format() const noexcept { return format_; }
    [[nodiscard]] std::size_t channels() const noexcept { return channel_count(format_); }
    [[nodiscard]] bool has_alpha() const noexcept { return vexel::has_alpha(format_); }
    [[nodiscard]] bool empty() const noexcept { return width_ == 0 || height_ == 0; }

    [[nodiscard]] std::span<const std::uint8_t> pixels8() const noexcept { return pixels8_; }
    [[nodiscard]] std::span<const std::uint16_t> pixels16() const noexcept { return pixels16_; }

    [[nodiscard]] const std::vector<image_frame>& frames() const noexcept { return frames_; }
    void set_frames(std::vector<image_frame> frames) { frames_ = std::move(frames); }

    /**
     * Packed row-major RGB triples, whatever the source format.
     */
    [[nodiscard]] std::vector<std::uint8_t> as_rgb8() const;

    /**
     * Packed row-major RGBA quadruples; opaque alpha for formats without alpha.
     */
    [[nodiscard]] std::vector<std::uint8_t> as_rgba8() const;

private:
    std::uint32_t width_ = 0;
    std::uint32_t height_ = 0;
    pixel_format format_ = pixel_format::rgb8;
    std::vector<std::uint8_t> pixels8_;
    std::vector<std::uint16_t> pixels16_;
    std::vector<image_frame> frames_;
};

} // namespace vexel

#endif // VEXEL_IMAGE_HPP_

#include <vexel/image.hpp>

#include <string>

namespace vexel {

namespace {

status check_layout(std::uint32_t width, std::uint32_t height, pixel_format format,
                    std::size_t samples) {
    if (width == 0 || height == 0) {
        return failure(decode_error::invalid_dimensions,
            "image dimensions must be nonzero, got " + std::to_string(width) + "x" +
            std::to_string(height));
    }
    const std::size_t expected = static_cast<std::size_t>(width) * height * channel_count(format);
    if (samples != expected) {
        return failure(decode_error::internal_error,
            "pixel buffer holds " + std::to_string(samples) + " samples, expected " +
            std::to_string(expected) + " for " + std::to_string(width) + "x" +
            std::to_string(height) + " " + to_string(format));
    }
    return {};
}

} // namespace

const char* to_string(pixel_format fmt) noexcept {
    switch (fmt) {
        case pixel_format::l8:     return "L8";
        case pixel_format::la8:    return "LA8";
        case pixel_format::l16:    return "L16";
        case pixel_format::la16:   return "LA16";
        case pixel_format::rgb8:   return "RGB8";
        case pixel_format::rgba8:  return "RGBA8";
        case pixel_format::rgb16:  return "RGB16";
        case pixel_format::rgba16: return "RGBA16";
    }
    return "unknown";
}

result<image> image::from_pixels(std::uint32_t width, std::uint32_t height,
                                 pixel_format format, std::vector<std::uint8_t> pixels) {
    if (is_16bit(format)) {
        return failure(decode_error::internal_error,
            std::string("8-bit buffer supplied for ") + to_string(format));
    }
    auto st = check_layout(width, height, format, pixels.size());
    if (!st) {
        return st.error_info();
    }

    image img;
    img.width_ = width;
    img.height_ = height;
    img.format_ = format;
    img.pixels8_ = std::move(pixels);
    return img;
}

result<image> image::from_pixels16(std::uint32_t width, std::uint32_t height,
                                   pixel_format format, std::vector<std::uint16_t> pixels) {
    if (!is_16bit(format)) {
        return failure(decode_error::internal_error,
            std::string("16-bit buffer supplied for ") + to_string(format));
    }
    auto st = check_layout(width, height, format, pixels.size());
    if (!st) {
        return st.error_info();
    }

    image img;
    img.width_ = width;
    img.height_ = height;
    img.format_ = format;
    img.pixels16_ = std::move(pixels);
    return img;
}

std::vector<std::uint8_t> image::as_rgba8() const {
    const std::size_t count = static_cast<std::size_t>(width_) * height_;
    const std::size_t ch = channels();
    std::vector<std::uint8_t> out(count * 4);

    auto sample = [&](std::size_t index) -> std::uint8_t {
        if (is_16bit(format_)) {
            return static_cast<std::uint8_t>(pixels16_[index] >> 8);
        }
        return pixels8_[index];
    };

    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t src = i * ch;
        std::uint8_t* dst = out.data() + i * 4;
        switch (ch) {
            case 1:
                dst[0] = dst[1] = dst[2] = sample(src);
                dst[3] = 0xFF;
                break;
            case 2:
                dst[0] = dst[1] = dst[2] = sample(src);
                dst[3] = sample(src + 1);
                break;
            case 3:
                dst[0] = sample(src);
                dst[1] = sample(src + 1);
                dst[2] = sample(src + 2);
                dst[3] = 0xFF;
                break;
            default:
                dst[0] = sample(src);
                dst[1] = sample(src + 1);
                dst[2] = sample(src + 2);
                dst[3] = sample(src + 3);
                break;
        }
    }
    return out;
}

std::vector<std::uint8_t> image::as_rgb8() const {
    if (format_ == pixel_format::rgb8) {
        return pixels8_;
    }

    const std::size_t count = static_cast<std::size_t>(width_) * height_;
    const auto rgba = as_rgba8();
    std::vector<std::uint8_t> out(count * 3);
    for (std::size_t i = 0; i < count; ++i) {
        out[i * 3 + 0] = rgba[i * 4 + 0];
        out[i * 3 + 1] = rgba[i * 4 + 1];
        out[i * 3 + 2] = rgba[i * 4 + 2];
    }
    return out;
}

} // namespace vexel

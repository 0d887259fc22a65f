#include <vexel/codecs/bmp.hpp>
#include <vexel/info.hpp>
#include <vexel/log.hpp>
#include <vexel/safe_access.hpp>
#include <formats/bmp/bmp.hh>

#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <string>
#include <vector>

namespace vexel {

const char* to_string(bmp_compression compression) noexcept {
    switch (compression) {
        case bmp_compression::rgb:             return "BI_RGB";
        case bmp_compression::rle8:            return "BI_RLE8";
        case bmp_compression::rle4:            return "BI_RLE4";
        case bmp_compression::bitfields:       return "BI_BITFIELDS";
        case bmp_compression::jpeg:            return "BI_JPEG";
        case bmp_compression::png:             return "BI_PNG";
        case bmp_compression::alpha_bitfields: return "BI_ALPHABITFIELDS";
    }
    return "unknown";
}

namespace {

constexpr std::size_t BMP_FILE_HEADER_SIZE = 14;

constexpr const char* BMP_SIGNATURES[] = {"BM", "BA", "CI", "CP", "IC", "PT"};

// Header layouts by size
constexpr std::uint32_t BMP_CORE_HEADER = 12;
constexpr std::uint32_t BMP_OS2_SHORT_HEADER = 16;
constexpr std::uint32_t BMP_INFO_HEADER = 40;
constexpr std::uint32_t BMP_V2_HEADER = 52;
constexpr std::uint32_t BMP_V3_HEADER = 56;
constexpr std::uint32_t BMP_OS2_V2_HEADER = 64;
constexpr std::uint32_t BMP_V4_HEADER = 108;
constexpr std::uint32_t BMP_V5_HEADER = 124;

// Count trailing zero bits
int count_zero_bits(std::uint32_t v) {
    if (v == 0) return 0;
    int count = 0;
    while ((v & 1) == 0) {
        count++;
        v >>= 1;
    }
    return count;
}

struct channel_mask {
    std::uint32_t mask = 0;
    int shift = 0;
    std::uint32_t max = 0;

    explicit channel_mask(std::uint32_t m)
        : mask(m), shift(count_zero_bits(m)), max(m >> count_zero_bits(m)) {}

    [[nodiscard]] std::uint8_t extract(std::uint32_t pixel) const {
        if (max == 0) {
            return 0;
        }
        return scale_to_8((pixel & mask) >> shift, max);
    }
};

// Parsed header plus the location of the color table
struct header_layout {
    std::size_t palette_offset = 0;
    std::size_t palette_entry_size = 4;
};

// Reads a 32-bit little-endian field at a fixed offset through the format library
std::uint32_t field32(const std::uint8_t* base, std::size_t offset, const std::uint8_t* end) {
    const std::uint8_t* ptr = base + offset;
    return formats::bmp::read_uint32(ptr, end);
}

template <typename Header>
void copy_common(const Header& header, bmp_info& info) {
    info.width = static_cast<std::int32_t>(header.width);
    info.height = static_cast<std::int32_t>(header.height);
    info.bits_per_pixel = static_cast<std::uint16_t>(header.bits_per_pixel);
    info.compression = static_cast<bmp_compression>(header.compression);
    info.colors_used = header.colors_used;
}

template <typename Header>
void copy_masks(const Header& header, bmp_info& info) {
    info.red_mask = header.red_mask;
    info.green_mask = header.green_mask;
    info.blue_mask = header.blue_mask;
}

// Throws on truncated input, like the formats::bmp readers it calls
void read_dib_header(const std::uint8_t* h, const std::uint8_t* end, bmp_info& info) {
    const std::uint32_t hs = info.header_size;
    const std::uint8_t* ptr = h;

    if (hs == BMP_CORE_HEADER) {
        auto header = formats::bmp::bmp_core_header::read(ptr, end);
        info.width = static_cast<std::int32_t>(header.width);
        info.height = static_cast<std::int32_t>(header.height);
        info.bits_per_pixel = static_cast<std::uint16_t>(header.bits_per_pixel);
        info.planes = static_cast<std::uint16_t>(field32(h, 8, end) & 0xFFFF);
        return;
    }

    if (hs == BMP_OS2_SHORT_HEADER) {
        // Truncated OS/2 2.x header: everything past the bit depth defaults to zero
        info.width = static_cast<std::int32_t>(field32(h, 4, end));
        info.height = static_cast<std::int32_t>(field32(h, 8, end));
        const std::uint32_t planes_bpp = field32(h, 12, end);
        info.planes = static_cast<std::uint16_t>(planes_bpp & 0xFFFF);
        info.bits_per_pixel = static_cast<std::uint16_t>(planes_bpp >> 16);
        return;
    }

    if (hs == BMP_OS2_V2_HEADER) {
        copy_common(formats::bmp::bmp_os2_v2_header::read(ptr, end), info);
    } else if (hs >= BMP_V4_HEADER) {
        auto header = formats::bmp::bmp_v4_header::read(ptr, end);
        copy_common(header, info);
        copy_masks(header, info);
        info.alpha_mask = header.alpha_mask;
    } else if (hs >= BMP_V3_HEADER) {
        auto header = formats::bmp::bmp_v3_header::read(ptr, end);
        copy_common(header, info);
        copy_masks(header, info);
        info.alpha_mask = header.alpha_mask;
    } else if (hs >= BMP_V2_HEADER) {
        auto header = formats::bmp::bmp_v2_header::read(ptr, end);
        copy_common(header, info);
        copy_masks(header, info);
    } else {
        copy_common(formats::bmp::bmp_info_header::read(ptr, end), info);
    }

    // Informational fields the header structs do not carry
    info.planes = static_cast<std::uint16_t>(field32(h, 12, end) & 0xFFFF);
    info.image_size = field32(h, 20, end);
    info.x_pixels_per_meter = static_cast<std::int32_t>(field32(h, 24, end));
    info.y_pixels_per_meter = static_cast<std::int32_t>(field32(h, 28, end));
    info.colors_important = field32(h, 36, end);
}

result<header_layout> parse_header(std::span<const std::uint8_t> data, bmp_info& info) {
    auto fh = check_range(data.size(), 0, BMP_FILE_HEADER_SIZE + 4);
    if (!fh) {
        return failure(decode_error::unexpected_eof, "file too small for BMP headers");
    }
    const std::uint8_t* p = data.data();
    const std::uint8_t* end = p + data.size();
    info.signature.assign(p, p + 2);

    try {
        const std::uint8_t* ptr = p;
        auto file_header = formats::bmp::bmp_file_header::read(ptr, end);
        info.data_offset = file_header.data_offset;
        info.file_size = field32(p, 2, end);
        info.header_size = field32(p, BMP_FILE_HEADER_SIZE, end);
    } catch (const std::exception& e) {
        return failure(decode_error::invalid_format, std::string("BMP file header: ") + e.what());
    }

    const std::uint32_t hs = info.header_size;
    if (hs != BMP_CORE_HEADER && hs != BMP_OS2_SHORT_HEADER && hs != BMP_INFO_HEADER &&
        hs != BMP_V2_HEADER && hs != BMP_V3_HEADER && hs != BMP_OS2_V2_HEADER &&
        hs != BMP_V4_HEADER && hs != BMP_V5_HEADER) {
        return failure(decode_error::invalid_format,
            "unsupported DIB header size " + std::to_string(hs));
    }
    auto dib = check_range(data.size(), BMP_FILE_HEADER_SIZE, BMP_FILE_HEADER_SIZE + hs);
    if (!dib) {
        return dib.error_info();
    }

    header_layout layout;
    layout.palette_offset = BMP_FILE_HEADER_SIZE + hs;
    if (hs == BMP_CORE_HEADER) {
        layout.palette_entry_size = 3;
    }

    try {
        read_dib_header(p + BMP_FILE_HEADER_SIZE, end, info);
    } catch (const std::exception& e) {
        return failure(decode_error::invalid_format, std::string("BMP info header: ") + e.what());
    }

    if (hs == BMP_OS2_V2_HEADER &&
        (info.compression == bmp_compression::bitfields || info.compression == bmp_compression::jpeg)) {
        // OS/2 reuses these values for Huffman 1D and RLE24
        return failure(decode_error::unsupported_format,
            "OS/2 compression " + std::to_string(static_cast<std::uint32_t>(info.compression)) +
            " not supported");
    }

    // BITMAPINFOHEADER keeps its masks after the header
    if (hs == BMP_INFO_HEADER &&
        (info.compression == bmp_compression::bitfields ||
         info.compression == bmp_compression::alpha_bitfields)) {
        const std::size_t mask_count = info.compression == bmp_compression::alpha_bitfields ? 4 : 3;
        auto masks = check_range(data.size(), layout.palette_offset, layout.palette_offset + mask_count * 4);
        if (!masks) {
            return masks.error_info();
        }
        const std::uint8_t* ptr = p + layout.palette_offset;
        info.red_mask = formats::bmp::read_uint32(ptr, end);
        info.green_mask = formats::bmp::read_uint32(ptr, end);
        info.blue_mask = formats::bmp::read_uint32(ptr, end);
        if (mask_count == 4) {
            info.alpha_mask = formats::bmp::read_uint32(ptr, end);
        }
        layout.palette_offset += mask_count * 4;
    }

    if (hs == BMP_OS2_V2_HEADER || hs == BMP_OS2_SHORT_HEADER) {
        // OS/2 2.x palettes come with 3- or 4-byte entries; detect from the space available
        const std::uint32_t colors = info.colors_used != 0 ? info.colors_used : 1u << std::min<unsigned>(info.bits_per_pixel, 8);
        if (info.bits_per_pixel <= 8 && colors > 0) {
            const std::size_t space = info.data_offset > layout.palette_offset
                ? info.data_offset - layout.palette_offset : 0;
            layout.palette_entry_size = (space / colors >= 4) ? 4 : 3;
        }
    }
    return layout;
}

status validate_header(const bmp_info& info, const decode_options& options) {
    if (info.width <= 0 || info.height == 0 || info.height == INT32_MIN) {
        return failure(decode_error::invalid_dimensions,
            "invalid dimensions " + std::to_string(info.width) + "x" + std::to_string(info.height));
    }
    auto dims = validate_dimensions(static_cast<std::uint32_t>(info.width),
                                    static_cast<std::uint32_t>(info.height < 0 ? -info.height : info.height),
                                    options);
    if (!dims) {
        return dims;
    }

    switch (info.bits_per_pixel) {
        case 1: case 2: case 4: case 8: case 16: case 24: case 32:
            break;
        default:
            return failure(decode_error::unsupported_format,
                "unsupported bit depth " + std::to_string(info.bits_per_pixel));
    }

    switch (info.compression) {
        case bmp_compression::rgb:
            break;
        case bmp_compression::rle8:
            if (info.bits_per_pixel != 8) {
                return failure(decode_error::invalid_data, "RLE8 requires 8 bits per pixel");
            }
            break;
        case bmp_compression::rle4:
            if (info.bits_per_pixel != 4) {
                return failure(decode_error::invalid_data, "RLE4 requires 4 bits per pixel");
            }
            break;
        case bmp_compression::bitfields:
        case bmp_compression::alpha_bitfields:
            if (info.bits_per_pixel != 16 && info.bits_per_pixel != 32) {
                return failure(decode_error::invalid_data, "bitfields require 16 or 32 bits per pixel");
            }
            break;
        case bmp_compression::jpeg:
        case bmp_compression::png:
            return failure(decode_error::unsupported_format,
                std::string("embedded ") + to_string(info.compression) + " data not supported");
        default:
            return failure(decode_error::unsupported_format,
                "unknown compression " + std::to_string(static_cast<std::uint32_t>(info.compression)));
    }

    if ((info.compression == bmp_compression::rle8 || info.compression == bmp_compression::rle4) &&
        info.top_down()) {
        return failure(decode_error::invalid_data, "RLE bitmaps cannot be top-down");
    }
    return {};
}

void read_color_table(std::span<const std::uint8_t> data, const header_layout& layout, bmp_info& info) {
    if (info.bits_per_pixel > 8) {
        return;
    }
    std::uint32_t colors = info.colors_used;
    const std::uint32_t max_colors = 1u << info.bits_per_pixel;
    if (colors == 0 || colors > max_colors) {
        colors = max_colors;
    }

    // Entries must lie between the headers and the pixel data
    const std::size_t end = std::min<std::size_t>(info.data_offset, data.size());
    const std::size_t available = end > layout.palette_offset
        ? (end - layout.palette_offset) / layout.palette_entry_size : 0;
    if (available < colors) {
        log_warn("BMP: color table holds " + std::to_string(available) + " of " +
                 std::to_string(colors) + " entries");
        colors = static_cast<std::uint32_t>(available);
    }

    info.color_table.clear();
    const std::uint8_t* pal = data.data() + layout.palette_offset;
    for (std::uint32_t i = 0; i < colors; i++) {
        info.color_table.push_back(bmp_color{pal[2], pal[1], pal[0]});  // BGR(X) -> RGB
        pal += layout.palette_entry_size;
    }
}

void decode_rle8(std::span<const std::uint8_t> src_data,
                 std::vector<std::uint8_t>& indices,
                 int width, int height) {
    indices.assign(static_cast<std::size_t>(width) * height, 0);
    const std::uint8_t* src = src_data.data();
    const std::uint8_t* end = src + src_data.size();

    int x = 0;
    int y = 0;

    while (src + 1 < end && y < height) {
        std::uint8_t count = *src++;
        std::uint8_t value = *src++;

        if (count == 0) {
            if (value == 0) {
                // End of line
                x = 0;
                y++;
            } else if (value == 1) {
                // End of bitmap
                return;
            } else if (value == 2) {
                // Delta
                if (src + 1 < end) {
                    x += *src++;
                    y += *src++;
                }
            } else {
                // Absolute mode
                for (int i = 0; i < value && src < end; i++) {
                    if (x < width) {
                        indices[static_cast<std::size_t>(y) * width + x] = *src;
                        x++;
                    }
                    src++;
                }
                // Pad to word boundary
                if ((value & 1) && src < end) ++src;
            }
        } else {
            for (int i = 0; i < count && x < width; i++) {
                indices[static_cast<std::size_t>(y) * width + x] = value;
                x++;
            }
        }
    }
    if (y < height) {
        log_warn("BMP: RLE8 data ended at row " + std::to_string(y) + " without end-of-bitmap");
    }
}

void decode_rle4(std::span<const std::uint8_t> src_data,
                 std::vector<std::uint8_t>& indices,
                 int width, int height) {
    indices.assign(static_cast<std::size_t>(width) * height, 0);
    const std::uint8_t* src = src_data.data();
    const std::uint8_t* end = src + src_data.size();

    int x = 0;
    int y = 0;

    while (src + 1 < end && y < height) {
        std::uint8_t count = *src++;
        std::uint8_t value = *src++;

        if (count == 0) {
            if (value == 0) {
                x = 0;
                y++;
            } else if (value == 1) {
                return;
            } else if (value == 2) {
                if (src + 1 < end) {
                    x += *src++;
                    y += *src++;
                }
            } else {
                // Absolute mode: value nibbles, padded to a 16-bit boundary
                const std::size_t bytes = (static_cast<std::size_t>(value) + 1) / 2;
                for (int i = 0; i < value; i++) {
                    const std::uint8_t* byte = src + i / 2;
                    if (byte >= end) {
                        break;
                    }
                    const std::uint8_t nibble = (i % 2 == 0) ? (*byte >> 4) : (*byte & 0x0F);
                    if (x < width) {
                        indices[static_cast<std::size_t>(y) * width + x] = nibble;
                        x++;
                    }
                }
                src += std::min<std::size_t>(bytes + (bytes & 1), static_cast<std::size_t>(end - src));
            }
        } else {
            // Run of pixels (alternating nibbles)
            const std::uint8_t hi = (value >> 4) & 0x0F;
            const std::uint8_t lo = value & 0x0F;
            for (int i = 0; i < count && x < width; i++) {
                indices[static_cast<std::size_t>(y) * width + x] = (i % 2 == 0) ? hi : lo;
                x++;
            }
        }
    }
    if (y < height) {
        log_warn("BMP: RLE4 data ended at row " + std::to_string(y) + " without end-of-bitmap");
    }
}

} // namespace

// ============================================================================
// BMP Decoder
// ============================================================================

bool bmp_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < 2) {
        return false;
    }
    for (const char* sig : BMP_SIGNATURES) {
        if (data[0] == static_cast<std::uint8_t>(sig[0]) && data[1] == static_cast<std::uint8_t>(sig[1])) {
            return true;
        }
    }
    return false;
}

bmp_decoder::bmp_decoder(std::unique_ptr<byte_source> source, const decode_options& options)
    : reader_(std::move(source)), options_(options) {}

status bmp_decoder::read_file() {
    auto rewind = reader_.reset();
    if (!rewind) {
        return rewind;
    }
    auto bytes = reader_.read_to_end();
    if (!bytes) {
        return bytes.error_info();
    }
    data_ = std::move(bytes.value());
    info_ = bmp_info{};

    if (!sniff(data_)) {
        return failure(decode_error::invalid_format, "not a BMP file");
    }
    auto layout = parse_header(data_, info_);
    if (!layout) {
        return layout.error_info();
    }
    read_color_table(data_, layout.value(), info_);
    return {};
}

result<image> bmp_decoder::decode() {
    auto st = read_file();
    headers_parsed_ = true;
    if (!st) {
        return st.error_info();
    }
    auto valid = validate_header(info_, options_);
    if (!valid) {
        return valid.error_info();
    }

    const int width = info_.width;
    const int height = info_.height < 0 ? -info_.height : info_.height;
    const int bpp = info_.bits_per_pixel;

    if (info_.data_offset >= data_.size()) {
        return failure(decode_error::unexpected_eof,
            "pixel data offset " + std::to_string(info_.data_offset) + " beyond end of file (" +
            std::to_string(data_.size()) + " bytes)");
    }
    std::span<const std::uint8_t> pixel_data(data_.data() + info_.data_offset,
                                              data_.size() - info_.data_offset);

    const std::size_t pixel_count = static_cast<std::size_t>(width) * height;
    bool bad_index = false;
    auto write_index = [&](std::uint8_t* dst, std::uint8_t index) {
        if (index < info_.color_table.size()) {
            const bmp_color& c = info_.color_table[index];
            dst[0] = c.r;
            dst[1] = c.g;
            dst[2] = c.b;
        } else {
            bad_index = true;
        }
    };

    // Handle RLE compression (always bottom-up)
    if (info_.compression == bmp_compression::rle8 || info_.compression == bmp_compression::rle4) {
        std::vector<std::uint8_t> indices;
        if (info_.compression == bmp_compression::rle8) {
            decode_rle8(pixel_data, indices, width, height);
        } else {
            decode_rle4(pixel_data, indices, width, height);
        }

        std::vector<std::uint8_t> rgb(pixel_count * 3, 0);
        for (int y = 0; y < height; y++) {
            const int src_y = height - 1 - y;
            for (int x = 0; x < width; x++) {
                write_index(rgb.data() + (static_cast<std::size_t>(y) * width + x) * 3,
                            indices[static_cast<std::size_t>(src_y) * width + x]);
            }
        }
        if (bad_index) {
            log_warn("BMP: color index beyond color table, using black");
        }
        return image::from_pixels(static_cast<std::uint32_t>(width), static_cast<std::uint32_t>(height),
                                  pixel_format::rgb8, std::move(rgb));
    }

    std::uint32_t red_mask = info_.red_mask;
    std::uint32_t green_mask = info_.green_mask;
    std::uint32_t blue_mask = info_.blue_mask;
    std::uint32_t alpha_mask = info_.alpha_mask;
    const bool bitfields = info_.compression == bmp_compression::bitfields ||
                           info_.compression == bmp_compression::alpha_bitfields;
    if (!bitfields) {
        if (bpp == 16) {
            // Default 16-bit format: 5-5-5
            red_mask = 0x7C00;
            green_mask = 0x03E0;
            blue_mask = 0x001F;
            alpha_mask = 0;
        } else if (bpp == 32) {
            red_mask = 0x00FF0000;
            green_mask = 0x0000FF00;
            blue_mask = 0x000000FF;
        }
    }
    const channel_mask red(red_mask);
    const channel_mask green(green_mask);
    const channel_mask blue(blue_mask);
    const channel_mask alpha(alpha_mask);

    const bool with_alpha = (bpp == 16 || bpp == 32) && alpha_mask != 0;
    const std::size_t channels = with_alpha ? 4 : 3;
    std::vector<std::uint8_t> out(pixel_count * channels, 0);

    // Uncompressed data
    const std::size_t src_row_size = row_stride_4byte(static_cast<std::uint32_t>(width), bpp);
    for (int y = 0; y < height; y++) {
        const int src_y = info_.top_down() ? y : (height - 1 - y);
        auto row = get_range_safe(pixel_data, static_cast<std::size_t>(src_y) * src_row_size,
                                  static_cast<std::size_t>(src_y) * src_row_size +
                                  (static_cast<std::size_t>(width) * bpp + 7) / 8);
        if (!row) {
            return failure(decode_error::unexpected_eof,
                "pixel data ends before row " + std::to_string(src_y) + ": " + row.message());
        }
        const std::uint8_t* src_row = row.value().data();
        std::uint8_t* dst = out.data() + static_cast<std::size_t>(y) * width * channels;

        for (int x = 0; x < width; x++, dst += channels) {
            if (bpp <= 8) {
                write_index(dst, extract_pixel(src_row, static_cast<std::size_t>(x), bpp));
            } else if (bpp == 24) {
                dst[0] = src_row[x * 3 + 2];  // R
                dst[1] = src_row[x * 3 + 1];  // G
                dst[2] = src_row[x * 3 + 0];  // B
            } else {
                const std::uint32_t pixel = bpp == 16 ? read_le16(src_row + x * 2) : read_le32(src_row + x * 4);
                dst[0] = red.extract(pixel);
                dst[1] = green.extract(pixel);
                dst[2] = blue.extract(pixel);
                if (with_alpha) {
                    dst[3] = alpha.extract(pixel);
                }
            }
        }
    }
    if (bad_index) {
        log_warn("BMP: color index beyond color table, using black");
    }

    return image::from_pixels(static_cast<std::uint32_t>(width), static_cast<std::uint32_t>(height),
                              with_alpha ? pixel_format::rgba8 : pixel_format::rgb8, std::move(out));
}

image_info bmp_decoder::get_image_info() {
    if (!headers_parsed_) {
        headers_parsed_ = true;
        auto st = read_file();
        if (!st) {
            log_warn("BMP: header parsing stopped: " + st.message());
        }
        auto rewind = reader_.reset();
        if (!rewind) {
            log_warn("BMP: " + rewind.message());
        }
    }
    return image_info{info_};
}

} // namespace vexel

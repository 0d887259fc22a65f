#include <vexel/codecs/png.hpp>
#include <vexel/info.hpp>
#include <vexel/log.hpp>
#include <vexel/safe_access.hpp>

#include "byte_io.hpp"
#include "decode_helpers.hpp"
#include "png_internal.hpp"

#include <lodepng.h>

#include <algorithm>
#include <cstring>
#include <string>

namespace vexel {

// ============================================================================
// Filters
// ============================================================================

namespace png_detail {

std::size_t filtered_size(std::uint32_t width, std::uint32_t height, std::size_t bits_per_pixel,
                          bool interlaced) noexcept {
    auto sub_image = [&](std::uint32_t w, std::uint32_t h) -> std::size_t {
        if (w == 0 || h == 0) {
            return 0;
        }
        return ((static_cast<std::size_t>(w) * bits_per_pixel + 7) / 8 + 1) * h;
    };
    if (!interlaced) {
        return sub_image(width, height);
    }
    std::size_t total = 0;
    for (const auto& pass : adam7_passes) {
        total += sub_image(pass_extent(width, pass.x0, pass.dx), pass_extent(height, pass.y0, pass.dy));
    }
    return total;
}

status unfilter_scanline(std::span<std::uint8_t> row, std::span<const std::uint8_t> prev,
                         std::size_t bpp, std::uint8_t filter) {
    const std::size_t n = row.size();
    auto up = [&](std::size_t i) -> std::uint8_t { return prev.empty() ? 0 : prev[i]; };

    switch (static_cast<filter_type>(filter)) {
        case filter_type::none:
            break;
        case filter_type::sub:
            for (std::size_t i = bpp; i < n; ++i) {
                row[i] = static_cast<std::uint8_t>(row[i] + row[i - bpp]);
            }
            break;
        case filter_type::up:
            for (std::size_t i = 0; i < n; ++i) {
                row[i] = static_cast<std::uint8_t>(row[i] + up(i));
            }
            break;
        case filter_type::average:
            for (std::size_t i = 0; i < n; ++i) {
                const unsigned left = i >= bpp ? row[i - bpp] : 0;
                row[i] = static_cast<std::uint8_t>(row[i] + ((left + up(i)) >> 1));
            }
            break;
        case filter_type::paeth:
            for (std::size_t i = 0; i < n; ++i) {
                const std::uint8_t a = i >= bpp ? row[i - bpp] : 0;
                const std::uint8_t c = i >= bpp ? up(i - bpp) : 0;
                row[i] = static_cast<std::uint8_t>(row[i] + paeth_predictor(a, up(i), c));
            }
            break;
        default:
            return failure(decode_error::invalid_data,
                "invalid scanline filter type " + std::to_string(filter));
    }
    return {};
}

result<std::vector<std::uint8_t>> unfilter_image(std::span<const std::uint8_t> data,
                                                 std::size_t row_bytes,
                                                 std::size_t height,
                                                 std::size_t bpp) {
    const std::size_t needed = (row_bytes + 1) * height;
    if (data.size() < needed) {
        return failure(decode_error::unexpected_eof,
            "image data holds " + std::to_string(data.size()) + " bytes, expected " +
            std::to_string(needed));
    }

    std::vector<std::uint8_t> out(row_bytes * height);
    for (std::size_t y = 0; y < height; ++y) {
        const std::uint8_t* src = data.data() + y * (row_bytes + 1);
        std::span<std::uint8_t> row(out.data() + y * row_bytes, row_bytes);
        std::memcpy(row.data(), src + 1, row_bytes);

        std::span<const std::uint8_t> prev;
        if (y > 0) {
            prev = std::span<const std::uint8_t>(out.data() + (y - 1) * row_bytes, row_bytes);
        }
        auto st = unfilter_scanline(row, prev, bpp, src[0]);
        if (!st) {
            return st.error_info();
        }
    }
    return out;
}

} // namespace png_detail

const char* to_string(png_color_type type) noexcept {
    switch (type) {
        case png_color_type::grayscale:       return "grayscale";
        case png_color_type::rgb:             return "RGB";
        case png_color_type::indexed:         return "indexed";
        case png_color_type::grayscale_alpha: return "grayscale+alpha";
        case png_color_type::rgba:            return "RGBA";
    }
    return "unknown";
}

namespace {

// PNG signature: 89 50 4E 47 0D 0A 1A 0A
constexpr std::uint8_t PNG_SIGNATURE[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::size_t PNG_SIGNATURE_SIZE = sizeof(PNG_SIGNATURE);
constexpr std::uint32_t PNG_MAX_CHUNK_LENGTH = 0x7FFFFFFF;

std::size_t channels_of(png_color_type type) noexcept {
    switch (type) {
        case png_color_type::grayscale:       return 1;
        case png_color_type::rgb:             return 3;
        case png_color_type::indexed:         return 1;
        case png_color_type::grayscale_alpha: return 2;
        case png_color_type::rgba:            return 4;
    }
    return 0;
}

bool valid_depth(png_color_type type, std::uint8_t depth) noexcept {
    switch (type) {
        case png_color_type::grayscale:
            return depth == 1 || depth == 2 || depth == 4 || depth == 8 || depth == 16;
        case png_color_type::indexed:
            return depth == 1 || depth == 2 || depth == 4 || depth == 8;
        case png_color_type::rgb:
        case png_color_type::grayscale_alpha:
        case png_color_type::rgba:
            return depth == 8 || depth == 16;
    }
    return false;
}

// Upper bound for zTXt and compressed iTXt payloads
constexpr std::size_t PNG_MAX_TEXT_SIZE = std::size_t{1} << 20;

result<std::vector<std::uint8_t>> inflate(std::span<const std::uint8_t> compressed, std::size_t max_size) {
    LodePNGDecompressSettings settings;
    lodepng_decompress_settings_init(&settings);
    settings.max_output_size = max_size;

    std::vector<unsigned char> out;
    const unsigned err = lodepng::decompress(out, compressed.data(), compressed.size(), settings);
    if (err != 0) {
        return failure(decode_error::invalid_data,
            std::string("inflate failed: ") + lodepng_error_text(err));
    }
    if (out.size() > max_size) {
        return failure(decode_error::invalid_data,
            "inflated data exceeds " + std::to_string(max_size) + " bytes");
    }
    return out;
}

// Split "keyword\0rest" at the first NUL.
std::pair<std::string, std::span<const std::uint8_t>> split_keyword(std::span<const std::uint8_t> data) {
    auto nul = std::find(data.begin(), data.end(), std::uint8_t{0});
    std::string keyword(data.begin(), nul);
    if (nul == data.end()) {
        return {keyword, {}};
    }
    return {keyword, data.subspan(static_cast<std::size_t>(nul - data.begin()) + 1)};
}

// ============================================================================
// Pixel reconstruction
// ============================================================================

// Unpack reconstructed rows at native bit depth into one value per sample.
void unpack_rows(std::span<const std::uint8_t> rows, std::size_t row_bytes, std::uint32_t width,
                 std::uint32_t height, std::size_t channels, unsigned depth,
                 std::vector<std::uint16_t>& samples, std::uint32_t x0, std::uint32_t y0,
                 std::uint32_t dx, std::uint32_t dy, std::uint32_t full_width) {
    const std::size_t per_row = static_cast<std::size_t>(width) * channels;
    for (std::uint32_t y = 0; y < height; ++y) {
        const std::uint8_t* row = rows.data() + static_cast<std::size_t>(y) * row_bytes;
        const std::size_t out_y = static_cast<std::size_t>(y0) + static_cast<std::size_t>(y) * dy;
        for (std::size_t s = 0; s < per_row; ++s) {
            std::uint16_t value = 0;
            if (depth == 16) {
                value = read_be16(row + s * 2);
            } else if (depth == 8) {
                value = row[s];
            } else {
                value = extract_pixel(row, s, static_cast<int>(depth));
            }
            const std::size_t x = s / channels;
            const std::size_t c = s % channels;
            const std::size_t out_x = x0 + x * dx;
            samples[(out_y * full_width + out_x) * channels + c] = value;
        }
    }
}

result<std::vector<std::uint16_t>> decode_samples(const png_info& info, std::uint32_t width,
                                                  std::uint32_t height,
                                                  std::span<const std::uint8_t> compressed) {
    const std::size_t channels = channels_of(info.color_type);
    const unsigned depth = info.bit_depth;
    const std::size_t bits_per_pixel = channels * depth;

    const std::size_t expected = png_detail::filtered_size(width, height, bits_per_pixel,
                                                           info.interlace_method != 0);
    auto raw = inflate(compressed, expected);
    if (!raw) {
        return raw.error_info();
    }
    const std::size_t bpp = std::max<std::size_t>(1, bits_per_pixel / 8);

    std::vector<std::uint16_t> samples(static_cast<std::size_t>(width) * height * channels, 0);
    std::span<const std::uint8_t> data = raw.value();

    if (info.interlace_method == 0) {
        const std::size_t row_bytes = (width * bits_per_pixel + 7) / 8;
        auto rows = png_detail::unfilter_image(data, row_bytes, height, bpp);
        if (!rows) {
            return rows.error_info();
        }
        unpack_rows(rows.value(), row_bytes, width, height, channels, depth, samples, 0, 0, 1, 1, width);
        return samples;
    }

    std::size_t offset = 0;
    for (const auto& pass : png_detail::adam7_passes) {
        const std::uint32_t pw = png_detail::pass_extent(width, pass.x0, pass.dx);
        const std::uint32_t ph = png_detail::pass_extent(height, pass.y0, pass.dy);
        if (pw == 0 || ph == 0) {
            continue;
        }
        const std::size_t row_bytes = (pw * bits_per_pixel + 7) / 8;
        const std::size_t pass_size = (row_bytes + 1) * ph;

        auto pass_data = get_range_safe(data, offset, std::min(data.size(), offset + pass_size));
        if (!pass_data) {
            return pass_data.error_info();
        }
        auto rows = png_detail::unfilter_image(pass_data.value(), row_bytes, ph, bpp);
        if (!rows) {
            return rows.error_info();
        }
        unpack_rows(rows.value(), row_bytes, pw, ph, channels, depth, samples,
                    pass.x0, pass.y0, pass.dx, pass.dy, width);
        offset += pass_size;
    }
    return samples;
}

result<image> samples_to_image(const png_info& info, std::uint32_t width, std::uint32_t height,
                               const std::vector<std::uint16_t>& samples) {
    const std::size_t count = static_cast<std::size_t>(width) * height;
    const unsigned depth = info.bit_depth;
    const std::uint32_t max_value = (1u << depth) - 1;

    if (info.color_type == png_color_type::indexed) {
        const bool alpha = !info.palette_alpha.empty();
        const std::size_t ch = alpha ? 4 : 3;
        std::vector<std::uint8_t> out(count * ch, 0);
        bool out_of_range = false;
        for (std::size_t i = 0; i < count; ++i) {
            const std::size_t index = samples[i];
            std::uint8_t* dst = out.data() + i * ch;
            if (index < info.palette.size()) {
                dst[0] = info.palette[index].r;
                dst[1] = info.palette[index].g;
                dst[2] = info.palette[index].b;
            } else {
                out_of_range = true;
            }
            if (alpha) {
                dst[3] = index < info.palette_alpha.size() ? info.palette_alpha[index] : 0xFF;
            }
        }
        if (out_of_range) {
            log_warn("PNG: palette index beyond " + std::to_string(info.palette.size()) +
                     " entries, using black");
        }
        return image::from_pixels(width, height, alpha ? pixel_format::rgba8 : pixel_format::rgb8,
                                  std::move(out));
    }

    const std::size_t in_ch = channels_of(info.color_type);
    const bool keyed = info.transparent_color.has_value() &&
                       (info.color_type == png_color_type::grayscale || info.color_type == png_color_type::rgb);
    const std::size_t out_ch = in_ch + (keyed ? 1 : 0);

    pixel_format format = pixel_format::l8;
    switch (out_ch) {
        case 1: format = depth == 16 ? pixel_format::l16 : pixel_format::l8; break;
        case 2: format = depth == 16 ? pixel_format::la16 : pixel_format::la8; break;
        case 3: format = depth == 16 ? pixel_format::rgb16 : pixel_format::rgb8; break;
        default: format = depth == 16 ? pixel_format::rgba16 : pixel_format::rgba8; break;
    }

    auto is_key = [&](std::size_t i) {
        const auto& key = *info.transparent_color;
        if (in_ch == 1) {
            return samples[i] == key[0];
        }
        return samples[i * 3] == key[0] && samples[i * 3 + 1] == key[1] && samples[i * 3 + 2] == key[2];
    };

    if (depth == 16) {
        std::vector<std::uint16_t> out;
        out.reserve(count * out_ch);
        for (std::size_t i = 0; i < count; ++i) {
            for (std::size_t c = 0; c < in_ch; ++c) {
                out.push_back(samples[i * in_ch + c]);
            }
            if (keyed) {
                out.push_back(is_key(i) ? 0 : 0xFFFF);
            }
        }
        return image::from_pixels16(width, height, format, std::move(out));
    }

    std::vector<std::uint8_t> out;
    out.reserve(count * out_ch);
    for (std::size_t i = 0; i < count; ++i) {
        for (std::size_t c = 0; c < in_ch; ++c) {
            out.push_back(scale_to_8(samples[i * in_ch + c], max_value));
        }
        if (keyed) {
            out.push_back(is_key(i) ? 0 : 0xFF);
        }
    }
    return image::from_pixels(width, height, format, std::move(out));
}

// ============================================================================
// Chunk parsers
// ============================================================================

status parse_ihdr(std::span<const std::uint8_t> data, png_info& info, const decode_options& options) {
    if (data.size() != 13) {
        return failure(decode_error::invalid_data,
            "IHDR length " + std::to_string(data.size()) + ", expected 13");
    }
    info.width = read_be32(data.data());
    info.height = read_be32(data.data() + 4);
    info.bit_depth = data[8];
    info.color_type = static_cast<png_color_type>(data[9]);
    info.compression_method = data[10];
    info.filter_method = data[11];
    info.interlace_method = data[12];

    if (data[9] > 6 || data[9] == 1 || data[9] == 5) {
        return failure(decode_error::invalid_data, "invalid color type " + std::to_string(data[9]));
    }
    if (!valid_depth(info.color_type, info.bit_depth)) {
        return failure(decode_error::invalid_data,
            "bit depth " + std::to_string(info.bit_depth) + " is not valid for " +
            to_string(info.color_type));
    }
    if (info.compression_method != 0 || info.filter_method != 0) {
        return failure(decode_error::unsupported_format, "unknown compression or filter method");
    }
    if (info.interlace_method > 1) {
        return failure(decode_error::invalid_data,
            "invalid interlace method " + std::to_string(info.interlace_method));
    }
    return validate_dimensions(info.width, info.height, options);
}

status parse_plte(std::span<const std::uint8_t> data, png_info& info) {
    if (data.size() % 3 != 0 || data.size() > 256 * 3 || data.empty()) {
        return failure(decode_error::invalid_data,
            "PLTE length " + std::to_string(data.size()) + " is not a valid palette size");
    }
    info.palette.clear();
    for (std::size_t i = 0; i < data.size(); i += 3) {
        info.palette.push_back(png_palette_entry{data[i], data[i + 1], data[i + 2]});
    }
    return {};
}

status parse_trns(std::span<const std::uint8_t> data, png_info& info) {
    switch (info.color_type) {
        case png_color_type::indexed:
            info.palette_alpha.assign(data.begin(), data.end());
            return {};
        case png_color_type::grayscale:
            if (data.size() < 2) {
                break;
            }
            info.transparent_color = std::array<std::uint16_t, 3>{read_be16(data.data()), 0, 0};
            return {};
        case png_color_type::rgb:
            if (data.size() < 6) {
                break;
            }
            info.transparent_color = std::array<std::uint16_t, 3>{
                read_be16(data.data()), read_be16(data.data() + 2), read_be16(data.data() + 4)};
            return {};
        default:
            log_warn("PNG: tRNS not allowed for color type with alpha, ignored");
            return {};
    }
    return failure(decode_error::invalid_data, "tRNS chunk too short");
}

void parse_bkgd(std::span<const std::uint8_t> data, png_info& info) {
    if (info.color_type == png_color_type::indexed && data.size() >= 1) {
        info.background = std::array<std::uint16_t, 3>{data[0], 0, 0};
    } else if ((info.color_type == png_color_type::grayscale ||
                info.color_type == png_color_type::grayscale_alpha) && data.size() >= 2) {
        info.background = std::array<std::uint16_t, 3>{read_be16(data.data()), 0, 0};
    } else if (data.size() >= 6) {
        info.background = std::array<std::uint16_t, 3>{
            read_be16(data.data()), read_be16(data.data() + 2), read_be16(data.data() + 4)};
    } else {
        log_warn("PNG: bKGD chunk too short, ignored");
    }
}

void parse_text_chunk(std::string_view type, std::span<const std::uint8_t> data, png_info& info) {
    auto [keyword, rest] = split_keyword(data);
    png_text entry;
    entry.keyword = std::move(keyword);

    if (type == "tEXt") {
        entry.text.assign(rest.begin(), rest.end());
    } else if (type == "zTXt") {
        entry.compressed = true;
        if (rest.empty()) {
            log_warn("PNG: zTXt without compression method");
            return;
        }
        auto text = inflate(rest.subspan(1), PNG_MAX_TEXT_SIZE);
        if (!text) {
            log_warn("PNG: zTXt '" + entry.keyword + "': " + text.message());
            return;
        }
        entry.text.assign(text.value().begin(), text.value().end());
    } else {
        entry.international = true;
        if (rest.size() < 2) {
            log_warn("PNG: iTXt chunk too short");
            return;
        }
        entry.compressed = rest[0] != 0;
        auto [language, after_lang] = split_keyword(rest.subspan(2));
        auto [translated, text] = split_keyword(after_lang);
        entry.language = std::move(language);
        entry.translated_keyword = std::move(translated);
        if (entry.compressed) {
            auto inflated = inflate(text, PNG_MAX_TEXT_SIZE);
            if (!inflated) {
                log_warn("PNG: iTXt '" + entry.keyword + "': " + inflated.message());
                return;
            }
            entry.text.assign(inflated.value().begin(), inflated.value().end());
        } else {
            entry.text.assign(text.begin(), text.end());
        }
    }
    info.text.push_back(std::move(entry));
}

status parse_fctl(std::span<const std::uint8_t> data, png_info& info) {
    if (data.size() != 26) {
        return failure(decode_error::invalid_data,
            "fcTL length " + std::to_string(data.size()) + ", expected 26");
    }
    png_frame_control fc;
    fc.sequence_number = read_be32(data.data());
    fc.width = read_be32(data.data() + 4);
    fc.height = read_be32(data.data() + 8);
    fc.x_offset = read_be32(data.data() + 12);
    fc.y_offset = read_be32(data.data() + 16);
    fc.delay_num = read_be16(data.data() + 20);
    fc.delay_den = read_be16(data.data() + 22);
    fc.dispose_op = data[24];
    fc.blend_op = data[25];

    if (fc.width == 0 || fc.height == 0 ||
        static_cast<std::uint64_t>(fc.x_offset) + fc.width > info.width ||
        static_cast<std::uint64_t>(fc.y_offset) + fc.height > info.height) {
        return failure(decode_error::invalid_data,
            "fcTL region " + std::to_string(fc.width) + "x" + std::to_string(fc.height) + "+" +
            std::to_string(fc.x_offset) + "+" + std::to_string(fc.y_offset) +
            " lies outside the canvas");
    }
    if (fc.dispose_op > 2 || fc.blend_op > 1) {
        return failure(decode_error::invalid_data, "fcTL dispose or blend op out of range");
    }
    info.frames.push_back(fc);
    return {};
}

status parse_ancillary(std::string_view type, std::span<const std::uint8_t> data, png_info& info) {
    if (type == "tRNS") {
        return parse_trns(data, info);
    }
    if (type == "gAMA") {
        if (data.size() < 4) {
            return failure(decode_error::invalid_data, "gAMA chunk too short");
        }
        info.gamma = read_be32(data.data()) / 100000.0;
    } else if (type == "cHRM") {
        if (data.size() < 32) {
            return failure(decode_error::invalid_data, "cHRM chunk too short");
        }
        auto v = [&](std::size_t i) { return read_be32(data.data() + i * 4) / 100000.0; };
        info.chromaticities = png_chromaticities{v(0), v(1), v(2), v(3), v(4), v(5), v(6), v(7)};
    } else if (type == "sRGB") {
        if (data.empty()) {
            return failure(decode_error::invalid_data, "sRGB chunk is empty");
        }
        info.srgb_intent = data[0];
    } else if (type == "iCCP") {
        auto [name, rest] = split_keyword(data);
        info.icc_profile = png_iccp{std::move(name), rest.empty() ? 0 : rest.size() - 1};
    } else if (type == "bKGD") {
        parse_bkgd(data, info);
    } else if (type == "sPLT") {
        auto [name, rest] = split_keyword(data);
        png_suggested_palette splt;
        splt.name = std::move(name);
        if (!rest.empty()) {
            splt.sample_depth = rest[0];
            splt.entries = (rest.size() - 1) / (splt.sample_depth == 16 ? 10 : 6);
        }
        info.suggested_palettes.push_back(std::move(splt));
    } else if (type == "pHYs") {
        if (data.size() < 9) {
            return failure(decode_error::invalid_data, "pHYs chunk too short");
        }
        info.physical = png_physical_dimensions{read_be32(data.data()), read_be32(data.data() + 4), data[8]};
    } else if (type == "sBIT") {
        info.significant_bits.assign(data.begin(), data.end());
    } else if (type == "hIST") {
        info.histogram.clear();
        for (std::size_t i = 0; i + 1 < data.size(); i += 2) {
            info.histogram.push_back(read_be16(data.data() + i));
        }
    } else if (type == "tIME") {
        if (data.size() < 7) {
            return failure(decode_error::invalid_data, "tIME chunk too short");
        }
        info.last_modified = png_time{read_be16(data.data()), data[2], data[3], data[4], data[5], data[6]};
    } else if (type == "tEXt" || type == "zTXt" || type == "iTXt") {
        parse_text_chunk(type, data, info);
    } else if (type == "acTL") {
        if (data.size() < 8) {
            return failure(decode_error::invalid_data, "acTL chunk too short");
        }
        info.animation = png_animation_control{read_be32(data.data()), read_be32(data.data() + 4)};
    } else if (type[0] >= 'A' && type[0] <= 'Z') {
        log_warn("PNG: unknown critical chunk " + std::string(type) + " skipped");
    } else {
        log_debug("PNG: skipping chunk " + std::string(type));
    }
    return {};
}

std::uint32_t frame_delay_ms(const png_frame_control& fc) {
    const std::uint32_t den = fc.delay_den == 0 ? 100 : fc.delay_den;
    return static_cast<std::uint32_t>(static_cast<std::uint64_t>(fc.delay_num) * 1000 / den);
}

} // namespace

// ============================================================================
// PNG Decoder
// ============================================================================

bool png_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < PNG_SIGNATURE_SIZE) {
        return false;
    }
    return std::equal(std::begin(PNG_SIGNATURE), std::end(PNG_SIGNATURE), data.begin());
}

png_decoder::png_decoder(std::unique_ptr<byte_source> source, const decode_options& options)
    : reader_(std::move(source)), options_(options) {}

status png_decoder::read_chunks(bool headers_only) {
    auto rewind = reader_.reset();
    if (!rewind) {
        return rewind;
    }
    info_ = png_info{};
    idat_.clear();
    frame_data_.clear();
    default_image_is_frame_ = false;

    std::uint8_t signature[PNG_SIGNATURE_SIZE];
    auto sig = reader_.read_bytes(signature);
    if (!sig || !sniff(signature)) {
        return failure(decode_error::invalid_format, "missing PNG signature");
    }

    bool seen_ihdr = false;
    bool seen_idat = false;
    bool seen_iend = false;

    while (!seen_iend) {
        if (reader_.bytes_left() == 0) {
            break;
        }
        auto length = reader_.read_u32();
        if (!length) {
            return length.error_info();
        }
        if (length.value() > PNG_MAX_CHUNK_LENGTH) {
            return failure(decode_error::invalid_data,
                "chunk length " + std::to_string(length.value()) + " exceeds 2^31-1");
        }

        std::uint8_t type_bytes[4];
        auto type_read = reader_.read_bytes(type_bytes);
        if (!type_read) {
            return type_read;
        }
        const std::string type(type_bytes, type_bytes + 4);

        const bool skip_payload = headers_only && (type == "IDAT" || type == "fdAT");
        std::vector<std::uint8_t> data;
        if (skip_payload) {
            auto st = reader_.skip(length.value());
            if (!st) {
                return st;
            }
        } else {
            auto payload = reader_.read_vector(length.value());
            if (!payload) {
                return payload.error_info();
            }
            data = std::move(payload.value());
        }

        auto crc = reader_.read_u32();
        if (!crc) {
            return crc.error_info();
        }
        if (options_.verify_crc && !skip_payload) {
            std::vector<std::uint8_t> covered(type_bytes, type_bytes + 4);
            covered.insert(covered.end(), data.begin(), data.end());
            const unsigned computed = lodepng_crc32(covered.data(), covered.size());
            if (computed != crc.value()) {
                log_warn("PNG: CRC mismatch in " + type + " chunk");
            }
        }
        info_.chunks.push_back(type);

        if (!seen_ihdr && type != "IHDR") {
            return failure(decode_error::invalid_data, type + " chunk before IHDR");
        }

        if (type == "IHDR") {
            if (seen_ihdr) {
                return failure(decode_error::invalid_data, "duplicate IHDR chunk");
            }
            seen_ihdr = true;
            auto st = parse_ihdr(data, info_, options_);
            if (!st) {
                return st;
            }
        } else if (type == "PLTE") {
            if (seen_idat) {
                return failure(decode_error::invalid_data, "PLTE chunk after IDAT");
            }
            auto st = parse_plte(data, info_);
            if (!st) {
                return st;
            }
        } else if (type == "IDAT") {
            if (info_.color_type == png_color_type::indexed && info_.palette.empty()) {
                return failure(decode_error::invalid_data, "indexed image without PLTE before IDAT");
            }
            if (!seen_idat && !info_.frames.empty()) {
                default_image_is_frame_ = true;
            }
            seen_idat = true;
            idat_.insert(idat_.end(), data.begin(), data.end());
        } else if (type == "IEND") {
            seen_iend = true;
        } else if (type == "fcTL") {
            auto st = parse_fctl(data, info_);
            if (!st) {
                return st;
            }
            frame_data_.emplace_back();
        } else if (type == "fdAT") {
            if (frame_data_.empty()) {
                return failure(decode_error::invalid_data, "fdAT chunk before fcTL");
            }
            if (!skip_payload && data.size() >= 4) {
                frame_data_.back().insert(frame_data_.back().end(), data.begin() + 4, data.end());
            }
        } else {
            auto st = parse_ancillary(type, data, info_);
            if (!st) {
                return st;
            }
        }
    }

    if (!seen_ihdr) {
        return failure(decode_error::invalid_data, "missing IHDR chunk");
    }
    if (!seen_idat) {
        return failure(decode_error::invalid_data, "missing IDAT chunk");
    }
    if (!seen_iend) {
        log_warn("PNG: stream ended without IEND chunk");
    }
    return {};
}

result<image> png_decoder::decode() {
    auto st = read_chunks(false);
    headers_parsed_ = true;
    if (!st) {
        return st.error_info();
    }

    auto samples = decode_samples(info_, info_.width, info_.height, idat_);
    if (!samples) {
        return samples.error_info();
    }
    auto img = samples_to_image(info_, info_.width, info_.height, samples.value());
    if (!img) {
        return img;
    }

    if (!options_.decode_frames || info_.frames.empty()) {
        return img;
    }

    std::vector<image_frame> frames;
    for (std::size_t i = 0; i < info_.frames.size(); ++i) {
        if (frames.size() >= options_.max_frames) {
            log_warn("PNG: frame limit " + std::to_string(options_.max_frames) + " reached");
            break;
        }
        const auto& fc = info_.frames[i];

        image_frame frame;
        frame.left = fc.x_offset;
        frame.top = fc.y_offset;
        frame.width = fc.width;
        frame.height = fc.height;
        frame.delay_ms = frame_delay_ms(fc);
        frame.dispose = static_cast<frame_dispose>(fc.dispose_op);
        frame.blend = fc.blend_op == 0 ? frame_blend::source : frame_blend::over;

        if (i == 0 && default_image_is_frame_) {
            frame.rgba = img.value().as_rgba8();
        } else {
            auto frame_samples = decode_samples(info_, fc.width, fc.height, frame_data_[i]);
            if (!frame_samples) {
                log_warn("PNG: frame " + std::to_string(i) + ": " + frame_samples.message());
                continue;
            }
            auto frame_img = samples_to_image(info_, fc.width, fc.height, frame_samples.value());
            if (!frame_img) {
                log_warn("PNG: frame " + std::to_string(i) + ": " + frame_img.message());
                continue;
            }
            frame.rgba = frame_img.value().as_rgba8();
        }
        frames.push_back(std::move(frame));
    }
    img.value().set_frames(std::move(frames));
    return img;
}

image_info png_decoder::get_image_info() {
    if (!headers_parsed_) {
        headers_parsed_ = true;
        auto st = read_chunks(true);
        if (!st) {
            log_warn("PNG: header parsing stopped: " + st.message());
        }
        auto rewind = reader_.reset();
        if (!rewind) {
            log_warn("PNG: " + rewind.message());
        }
    }
    return image_info{info_};
}

} // namespace vexel

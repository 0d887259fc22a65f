#include <vexel/info.hpp>

#include <iomanip>
#include <sstream>
#include <type_traits>

namespace vexel {

image_format image_info::format() const noexcept {
    switch (details.index()) {
        case 0: return image_format::jpeg;
        case 1: return image_format::png;
        case 2: return image_format::gif;
        case 3: return image_format::bmp;
        case 4: return image_format::netpbm;
        default: return std::get_if<stub_info>(&details)->format;
    }
}

std::pair<std::uint32_t, std::uint32_t> image_info::dimensions() const noexcept {
    return std::visit([](const auto& d) -> std::pair<std::uint32_t, std::uint32_t> {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, gif_info>) {
            return {d.canvas_width, d.canvas_height};
        } else if constexpr (std::is_same_v<T, bmp_info>) {
            return {static_cast<std::uint32_t>(d.width < 0 ? 0 : d.width),
                    static_cast<std::uint32_t>(d.height < 0 ? -static_cast<std::int64_t>(d.height) : d.height)};
        } else if constexpr (std::is_same_v<T, stub_info>) {
            return {0, 0};
        } else {
            return {d.width, d.height};
        }
    }, details);
}

namespace {

// ============================================================================
// Per-format reports
// ============================================================================

void write_jpeg(std::ostream& os, const jpeg_info& info) {
    os << "  Mode:        " << to_string(info.mode) << ", " << to_string(info.coding) << " coding\n";
    if (info.frame_marker) {
        os << "  Frame:       " << to_string(*info.frame_marker) << "\n";
    }
    os << "  Precision:   " << static_cast<int>(info.precision) << " bits\n";
    os << "  Components:  " << info.components.size() << "\n";
    for (const auto& c : info.components) {
        os << "    id " << static_cast<int>(c.id) << ": sampling " << static_cast<int>(c.h_sampling)
           << "x" << static_cast<int>(c.v_sampling) << ", quant table "
           << static_cast<int>(c.quant_table_id) << "\n";
    }
    os << "  Tables:      " << info.quantization_tables.size() << " quantization, "
       << info.huffman_tables.size() << " Huffman, " << info.arithmetic_tables.size()
       << " arithmetic conditioning\n";
    if (info.restart_interval != 0) {
        os << "  Restart:     every " << info.restart_interval << " MCUs\n";
    }
    os << "  Scans:       " << info.scans.size() << "\n";
    for (std::size_t i = 0; i < info.scans.size(); ++i) {
        const auto& s = info.scans[i];
        os << "    #" << i << ": " << s.components.size() << " component(s), Ss=" << static_cast<int>(s.spectral_start)
           << " Se=" << static_cast<int>(s.spectral_end) << " Ah=" << static_cast<int>(s.approx_high)
           << " Al=" << static_cast<int>(s.approx_low) << ", " << s.data_length << " bytes in "
           << s.segments << " segment(s)\n";
    }
    if (info.jfif) {
        const auto& j = *info.jfif;
        os << "  JFIF:        version " << static_cast<int>(j.version_major) << "."
           << std::setw(2) << std::setfill('0') << static_cast<int>(j.version_minor) << std::setfill(' ')
           << ", density " << j.x_density << "x" << j.y_density << " (units "
           << static_cast<int>(j.density_units) << ")";
        if (j.thumbnail_width != 0) {
            os << ", thumbnail " << static_cast<int>(j.thumbnail_width) << "x"
               << static_cast<int>(j.thumbnail_height);
        }
        os << "\n";
    }
    if (info.exif) {
        os << "  EXIF:        " << (info.exif->big_endian ? "big" : "little") << "-endian, "
           << info.exif->entries.size() << " IFD0 entries\n";
    }
    if (info.adobe_transform) {
        os << "  Adobe:       transform " << static_cast<int>(*info.adobe_transform) << "\n";
    }
    for (const auto& c : info.comments) {
        os << "  Comment:     " << c << "\n";
    }
}

void write_png(std::ostream& os, const png_info& info) {
    os << "  Color type:  " << to_string(info.color_type) << ", " << static_cast<int>(info.bit_depth)
       << " bits per sample\n";
    os << "  Interlace:   " << (info.interlace_method == 1 ? "Adam7" : "none") << "\n";
    if (!info.palette.empty()) {
        os << "  Palette:     " << info.palette.size() << " entries";
        if (!info.palette_alpha.empty()) {
            os << ", " << info.palette_alpha.size() << " with alpha";
        }
        os << "\n";
    }
    if (info.transparent_color) {
        os << "  Transparent: key color\n";
    }
    if (info.gamma) {
        os << "  Gamma:       " << *info.gamma << "\n";
    }
    if (info.srgb_intent) {
        os << "  sRGB:        rendering intent " << static_cast<int>(*info.srgb_intent) << "\n";
    }
    if (info.icc_profile) {
        os << "  ICC profile: " << info.icc_profile->name << " (" << info.icc_profile->compressed_size
           << " bytes compressed)\n";
    }
    if (info.physical) {
        os << "  Physical:    " << info.physical->x_pixels_per_unit << "x" << info.physical->y_pixels_per_unit
           << (info.physical->unit == 1 ? " per metre" : " (aspect ratio)") << "\n";
    }
    if (info.last_modified) {
        const auto& t = *info.last_modified;
        os << "  Modified:    " << t.year << "-" << static_cast<int>(t.month) << "-" << static_cast<int>(t.day)
           << " " << static_cast<int>(t.hour) << ":" << static_cast<int>(t.minute) << ":"
           << static_cast<int>(t.second) << "\n";
    }
    for (const auto& t : info.text) {
        os << "  Text:        " << t.keyword << " = " << t.text << "\n";
    }
    if (info.animation) {
        os << "  Animation:   " << info.animation->num_frames << " frames, "
           << (info.animation->num_plays == 0 ? std::string("loops forever")
                                              : std::to_string(info.animation->num_plays) + " plays")
           << "\n";
    }
    os << "  Chunks:      ";
    for (std::size_t i = 0; i < info.chunks.size(); ++i) {
        os << (i ? " " : "") << info.chunks[i];
    }
    os << "\n";
}

void write_gif(std::ostream& os, const gif_info& info) {
    os << "  Version:     GIF" << info.version << "\n";
    if (info.global_color_table_flag) {
        os << "  Colors:      " << info.global_color_table_size << " global, background index "
           << static_cast<int>(info.background_color_index) << "\n";
    }
    os << "  Frames:      " << info.frames.size() << "\n";
    for (std::size_t i = 0; i < info.frames.size(); ++i) {
        const auto& f = info.frames[i];
        os << "    #" << i << ": " << f.width << "x" << f.height << "+" << f.left << "+" << f.top
           << ", " << f.delay_ms << " ms, " << to_string(f.disposal)
           << (f.interlaced ? ", interlaced" : "")
           << (f.local_color_table_flag ? ", local colors" : "") << "\n";
    }
    for (const auto& app : info.app_extensions) {
        os << "  Application: " << app.identifier << app.auth_code;
        if (app.loop_count) {
            os << ", loop count " << *app.loop_count;
        }
        os << "\n";
    }
    for (const auto& c : info.comments) {
        os << "  Comment:     " << c << "\n";
    }
}

void write_bmp(std::ostream& os, const bmp_info& info) {
    os << "  Signature:   " << info.signature << "\n";
    os << "  DIB header:  " << info.header_size << " bytes\n";
    os << "  Depth:       " << info.bits_per_pixel << " bits per pixel, " << to_string(info.compression) << "\n";
    os << "  Orientation: " << (info.top_down() ? "top-down" : "bottom-up") << "\n";
    if (!info.color_table.empty()) {
        os << "  Colors:      " << info.color_table.size() << "\n";
    }
    if (info.red_mask | info.green_mask | info.blue_mask | info.alpha_mask) {
        os << std::hex << "  Masks:       R " << info.red_mask << " G " << info.green_mask
           << " B " << info.blue_mask << " A " << info.alpha_mask << std::dec << "\n";
    }
}

void write_netpbm(std::ostream& os, const netpbm_info& info) {
    os << "  Variant:     " << to_string(info.variant) << "\n";
    os << "  Maxval:      " << info.max_value << "\n";
    os << "  Depth:       " << info.depth << "\n";
    if (!info.tuple_type.empty()) {
        os << "  Tuple type:  " << info.tuple_type << "\n";
    }
    for (const auto& c : info.comments) {
        os << "  Comment:     " << c << "\n";
    }
}

void write_stub(std::ostream& os, const stub_info& info) {
    os << "  Container:   " << info.container;
    if (!info.brand.empty()) {
        os << " (" << info.brand << ")";
    }
    os << "\n  File size:   " << info.file_size << " bytes\n";
    os << "  Decoding:    not implemented\n";
}

} // namespace

std::string format_info(const image_info& info) {
    std::ostringstream os;
    const auto [width, height] = info.dimensions();
    os << "Format:        " << to_string(info.format()) << "\n";
    if (width != 0 || height != 0) {
        os << "  Dimensions:  " << width << "x" << height << "\n";
    }

    std::visit([&](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, jpeg_info>) {
            write_jpeg(os, d);
        } else if constexpr (std::is_same_v<T, png_info>) {
            write_png(os, d);
        } else if constexpr (std::is_same_v<T, gif_info>) {
            write_gif(os, d);
        } else if constexpr (std::is_same_v<T, bmp_info>) {
            write_bmp(os, d);
        } else if constexpr (std::is_same_v<T, netpbm_info>) {
            write_netpbm(os, d);
        } else {
            write_stub(os, d);
        }
    }, info.details);
    return os.str();
}

} // namespace vexel

#include <vexel/codecs/jpeg.hpp>
#include <vexel/info.hpp>
#include <vexel/log.hpp>
#include <vexel/safe_access.hpp>

#include "byte_io.hpp"
#include "decode_helpers.hpp"
#include "jpeg_internal.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <string>

namespace vexel {

using jpeg_detail::component_plane;
using jpeg_detail::frame_layout;
using jpeg_detail::huffman_lookup;
using jpeg_detail::mcu_block;
using jpeg_detail::scan_tables;

// ============================================================================
// Markers
// ============================================================================

namespace {

constexpr auto make_known_markers() {
    std::array<jpeg_marker, 64> markers{};
    markers[0] = jpeg_marker::tem;
    for (std::uint16_t i = 0; i < 63; ++i) {
        markers[i + 1] = static_cast<jpeg_marker>(0xFFC0 + i);
    }
    return markers;
}

constexpr auto known_markers = make_known_markers();

constexpr const char* marker_names[63] = {
    "SOF0", "SOF1", "SOF2", "SOF3", "DHT", "SOF5", "SOF6", "SOF7",
    "JPG", "SOF9", "SOF10", "SOF11", "DAC", "SOF13", "SOF14", "SOF15",
    "RST0", "RST1", "RST2", "RST3", "RST4", "RST5", "RST6", "RST7",
    "SOI", "EOI", "SOS", "DQT", "DNL", "DRI", "DHP", "EXP",
    "APP0", "APP1", "APP2", "APP3", "APP4", "APP5", "APP6", "APP7",
    "APP8", "APP9", "APP10", "APP11", "APP12", "APP13", "APP14", "APP15",
    "JPG0", "JPG1", "JPG2", "JPG3", "JPG4", "JPG5", "JPG6", "JPG7",
    "JPG8", "JPG9", "JPG10", "JPG11", "JPG12", "JPG13", "COM"
};

bool is_rst(jpeg_marker m) noexcept {
    const auto v = marker_to_u16(m);
    return v >= 0xFFD0 && v <= 0xFFD7;
}

} // namespace

std::span<const jpeg_marker> jpeg_known_markers() noexcept {
    return known_markers;
}

const char* to_string(jpeg_marker m) noexcept {
    const auto v = marker_to_u16(m);
    if (v == 0xFF01) {
        return "TEM";
    }
    if (v >= 0xFFC0 && v <= 0xFFFE) {
        return marker_names[v - 0xFFC0];
    }
    return "RES";
}

const char* to_string(jpeg_mode mode) noexcept {
    switch (mode) {
        case jpeg_mode::baseline:            return "baseline";
        case jpeg_mode::extended_sequential: return "extended sequential";
        case jpeg_mode::progressive:         return "progressive";
        case jpeg_mode::lossless:            return "lossless";
    }
    return "unknown";
}

const char* to_string(jpeg_coding coding) noexcept {
    switch (coding) {
        case jpeg_coding::huffman:    return "Huffman";
        case jpeg_coding::arithmetic: return "arithmetic";
    }
    return "unknown";
}

// ============================================================================
// Frame layout
// ============================================================================

namespace jpeg_detail {

frame_layout make_frame_layout(const jpeg_info& info) {
    frame_layout layout;
    for (const auto& c : info.components) {
        layout.h_max = std::max<int>(layout.h_max, c.h_sampling);
        layout.v_max = std::max<int>(layout.v_max, c.v_sampling);
    }

    const std::size_t mcu_w = 8 * static_cast<std::size_t>(layout.h_max);
    const std::size_t mcu_h = 8 * static_cast<std::size_t>(layout.v_max);
    layout.mcus_x = (info.width + mcu_w - 1) / mcu_w;
    layout.mcus_y = (info.height + mcu_h - 1) / mcu_h;

    for (std::size_t i = 0; i < info.components.size(); ++i) {
        const auto& c = info.components[i];
        component_plane plane;
        plane.component = i;
        plane.width = (static_cast<std::size_t>(info.width) * c.h_sampling + layout.h_max - 1) / layout.h_max;
        plane.height = (static_cast<std::size_t>(info.height) * c.v_sampling + layout.v_max - 1) / layout.v_max;
        plane.blocks_per_line = layout.mcus_x * c.h_sampling;
        plane.block_lines = layout.mcus_y * c.v_sampling;
        plane.coefficients.assign(plane.blocks_per_line * plane.block_lines * 64, 0);
        layout.planes.push_back(std::move(plane));
    }
    return layout;
}

} // namespace jpeg_detail

struct jpeg_decoder::frame_state {
    frame_layout layout;
    // Lossless frames: reconstructed samples per component, width * height
    std::vector<std::vector<std::int32_t>> samples;
};

// ============================================================================
// Segment parsers
// ============================================================================

namespace {

result<std::vector<std::uint8_t>> read_segment_payload(bit_reader& reader, jpeg_marker marker) {
    auto length = reader.read_u16();
    if (!length) {
        return length.error_info();
    }
    if (length.value() < 2) {
        return failure(decode_error::invalid_data,
            std::string(to_string(marker)) + " segment length " + std::to_string(length.value()) +
            " is shorter than its length field");
    }
    return reader.read_vector(length.value() - 2u);
}

std::optional<std::size_t> find_component(const jpeg_info& info, std::uint8_t id) {
    for (std::size_t i = 0; i < info.components.size(); ++i) {
        if (info.components[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

status parse_dqt(bit_reader& seg, jpeg_info& info) {
    while (seg.bytes_left() > 0) {
        auto pq_tq = seg.read_u8();
        if (!pq_tq) {
            return pq_tq.error_info();
        }

        jpeg_quantization_table table;
        table.precision = pq_tq.value() >> 4;
        table.id = pq_tq.value() & 0x0F;
        if (table.precision > 1 || table.id > 3) {
            return failure(decode_error::invalid_data,
                "DQT: invalid precision/id byte " + std::to_string(pq_tq.value()));
        }

        for (std::size_t k = 0; k < 64; ++k) {
            std::uint16_t value = 0;
            if (table.precision == 0) {
                auto v = seg.read_u8();
                if (!v) {
                    return v.error_info();
                }
                value = v.value();
            } else {
                auto v = seg.read_u16();
                if (!v) {
                    return v.error_info();
                }
                value = v.value();
            }
            table.values[jpeg_zigzag[k]] = value;
        }

        auto& tables = info.quantization_tables;
        auto it = std::find_if(tables.begin(), tables.end(),
                               [&](const auto& t) { return t.id == table.id; });
        if (it != tables.end()) {
            *it = table;
        } else {
            tables.push_back(table);
        }
    }
    return {};
}

status parse_dht(bit_reader& seg, jpeg_info& info) {
    while (seg.bytes_left() > 0) {
        auto tc_th = seg.read_u8();
        if (!tc_th) {
            return tc_th.error_info();
        }

        jpeg_huffman_table table;
        table.table_class = tc_th.value() >> 4;
        table.id = tc_th.value() & 0x0F;
        if (table.table_class > 1 || table.id > 3) {
            return failure(decode_error::invalid_data,
                "DHT: invalid class/id byte " + std::to_string(tc_th.value()));
        }

        std::size_t total = 0;
        for (auto& count : table.counts) {
            auto c = seg.read_u8();
            if (!c) {
                return c.error_info();
            }
            count = c.value();
            total += count;
        }
        if (total > 256) {
            return failure(decode_error::invalid_data,
                "DHT: table declares " + std::to_string(total) + " symbols");
        }

        auto symbols = seg.read_vector(total);
        if (!symbols) {
            return symbols.error_info();
        }
        table.symbols = std::move(symbols.value());

        auto st = jpeg_detail::assign_canonical_codes(table);
        if (!st) {
            return st;
        }

        auto& tables = info.huffman_tables;
        auto it = std::find_if(tables.begin(), tables.end(), [&](const auto& t) {
            return t.id == table.id && t.table_class == table.table_class;
        });
        if (it != tables.end()) {
            *it = std::move(table);
        } else {
            tables.push_back(std::move(table));
        }
    }
    return {};
}

status parse_dac(bit_reader& seg, jpeg_info& info) {
    while (seg.bytes_left() > 0) {
        auto tc_tb = seg.read_u8();
        if (!tc_tb) {
            return tc_tb.error_info();
        }
        auto value = seg.read_u8();
        if (!value) {
            return value.error_info();
        }

        jpeg_arithmetic_table table;
        table.table_class = tc_tb.value() >> 4;
        table.id = tc_tb.value() & 0x0F;
        table.value = value.value();
        if (table.table_class > 1 || table.id > 3) {
            return failure(decode_error::invalid_data,
                "DAC: invalid class/id byte " + std::to_string(tc_tb.value()));
        }
        if (table.table_class == 0 && (table.value & 0x0F) > (table.value >> 4)) {
            return failure(decode_error::invalid_data, "DAC: DC conditioning L exceeds U");
        }
        if (table.table_class == 1 && (table.value < 1 || table.value > 63)) {
            return failure(decode_error::invalid_data,
                "DAC: AC conditioning Kx " + std::to_string(table.value) + " outside 1..63");
        }

        auto& tables = info.arithmetic_tables;
        auto it = std::find_if(tables.begin(), tables.end(), [&](const auto& t) {
            return t.id == table.id && t.table_class == table.table_class;
        });
        if (it != tables.end()) {
            *it = table;
        } else {
            tables.push_back(table);
        }
    }
    return {};
}

status parse_sof(jpeg_marker marker, bit_reader& seg, jpeg_info& info, const decode_options& options) {
    if (info.frame_marker) {
        return failure(decode_error::invalid_data, "multiple SOF segments in one image");
    }

    switch (marker) {
        case jpeg_marker::sof0:  info.mode = jpeg_mode::baseline; break;
        case jpeg_marker::sof1:  info.mode = jpeg_mode::extended_sequential; break;
        case jpeg_marker::sof2:  info.mode = jpeg_mode::progressive; break;
        case jpeg_marker::sof3:  info.mode = jpeg_mode::lossless; break;
        case jpeg_marker::sof9:
            info.mode = jpeg_mode::extended_sequential;
            info.coding = jpeg_coding::arithmetic;
            break;
        case jpeg_marker::sof10:
            info.mode = jpeg_mode::progressive;
            info.coding = jpeg_coding::arithmetic;
            break;
        default:
            return failure(decode_error::unsupported_format,
                std::string("unsupported frame type ") + to_string(marker));
    }
    info.frame_marker = marker;

    auto precision = seg.read_u8();
    if (!precision) {
        return precision.error_info();
    }
    auto height = seg.read_u16();
    if (!height) {
        return height.error_info();
    }
    auto width = seg.read_u16();
    if (!width) {
        return width.error_info();
    }
    auto count = seg.read_u8();
    if (!count) {
        return count.error_info();
    }

    info.precision = precision.value();
    info.height = height.value();
    info.width = width.value();

    for (unsigned i = 0; i < count.value(); ++i) {
        auto id = seg.read_u8();
        if (!id) {
            return id.error_info();
        }
        auto hv = seg.read_u8();
        if (!hv) {
            return hv.error_info();
        }
        auto tq = seg.read_u8();
        if (!tq) {
            return tq.error_info();
        }

        jpeg_component c;
        c.id = id.value();
        c.h_sampling = hv.value() >> 4;
        c.v_sampling = hv.value() & 0x0F;
        c.quant_table_id = tq.value();
        if (c.h_sampling < 1 || c.h_sampling > 4 || c.v_sampling < 1 || c.v_sampling > 4) {
            return failure(decode_error::invalid_data,
                "component " + std::to_string(c.id) + " has invalid sampling factors " +
                std::to_string(c.h_sampling) + "x" + std::to_string(c.v_sampling));
        }
        if (find_component(info, c.id)) {
            return failure(decode_error::invalid_data,
                "duplicate component id " + std::to_string(c.id));
        }
        info.components.push_back(c);
    }

    if (info.mode == jpeg_mode::lossless) {
        if (info.precision < 2 || info.precision > 16) {
            return failure(decode_error::invalid_data,
                "lossless sample precision " + std::to_string(info.precision) + " outside 2..16");
        }
        for (const auto& c : info.components) {
            if (c.h_sampling != 1 || c.v_sampling != 1) {
                return failure(decode_error::unsupported_format,
                    "subsampled lossless frames are not supported");
            }
        }
    } else if (info.precision != 8 && !(info.precision == 12 && info.mode != jpeg_mode::baseline)) {
        return failure(decode_error::invalid_data,
            std::string("sample precision ") + std::to_string(info.precision) +
            " is not valid for " + to_string(info.mode) + " frames");
    }

    if (info.components.empty() || info.components.size() > 4) {
        return failure(decode_error::unsupported_format,
            "frames with " + std::to_string(info.components.size()) + " components are not supported");
    }
    if (info.height == 0) {
        return failure(decode_error::unsupported_format,
            "frame height defined by DNL is not supported");
    }
    return validate_dimensions(info.width, info.height, options);
}

status parse_dri(bit_reader& seg, jpeg_info& info) {
    auto interval = seg.read_u16();
    if (!interval) {
        return interval.error_info();
    }
    info.restart_interval = interval.value();
    return {};
}

void parse_jfif(std::span<const std::uint8_t> payload, jpeg_info& info) {
    if (payload.size() < 14) {
        log_warn("JPEG: JFIF segment too short (" + std::to_string(payload.size()) + " bytes)");
        return;
    }

    jfif_header jfif;
    jfif.identifier = "JFIF";
    jfif.version_major = payload[5];
    jfif.version_minor = payload[6];
    jfif.density_units = payload[7];
    jfif.x_density = read_be16(payload.data() + 8);
    jfif.y_density = read_be16(payload.data() + 10);
    jfif.thumbnail_width = payload[12];
    jfif.thumbnail_height = payload[13];

    const std::size_t thumb = static_cast<std::size_t>(jfif.thumbnail_width) * jfif.thumbnail_height * 3;
    auto data = get_range_safe(payload, 14, 14 + thumb);
    if (data) {
        jfif.thumbnail.assign(data.value().begin(), data.value().end());
    } else {
        log_warn("JPEG: JFIF thumbnail truncated: " + data.message());
    }
    if (payload.size() != 14 + thumb) {
        log_warn("JPEG: JFIF segment length " + std::to_string(payload.size() + 2) +
                 ", expected " + std::to_string(16 + thumb));
    }
    info.jfif = std::move(jfif);
}

void parse_exif(std::span<const std::uint8_t> payload, jpeg_info& info) {
    exif_header exif;
    exif.identifier = "Exif";

    auto tiff = get_range_safe(payload, 6, payload.size());
    if (!tiff || tiff.value().size() < 8) {
        log_warn("JPEG: EXIF segment too short for a TIFF header");
        return;
    }
    const auto data = tiff.value();

    if (data[0] == 'M' && data[1] == 'M') {
        exif.big_endian = true;
    } else if (data[0] != 'I' || data[1] != 'I') {
        log_warn("JPEG: EXIF byte order mark is neither II nor MM");
        return;
    }

    auto u16 = [&](std::size_t offset) {
        return exif.big_endian ? read_be16(data.data() + offset) : read_le16(data.data() + offset);
    };
    auto u32 = [&](std::size_t offset) {
        return exif.big_endian ? read_be32(data.data() + offset) : read_le32(data.data() + offset);
    };

    if (u16(2) != 42) {
        log_warn("JPEG: EXIF TIFF header magic is " + std::to_string(u16(2)) + ", expected 42");
    }
    exif.first_ifd_offset = u32(4);

    const std::size_t ifd = exif.first_ifd_offset;
    auto count_range = check_range(data.size(), ifd, ifd + 2);
    if (!count_range) {
        log_warn("JPEG: EXIF IFD0 offset: " + count_range.message());
        info.exif = std::move(exif);
        return;
    }

    const std::size_t count = u16(ifd);
    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t entry = ifd + 2 + i * 12;
        auto range = check_range(data.size(), entry, entry + 12);
        if (!range) {
            log_warn("JPEG: EXIF IFD0 entry " + std::to_string(i) + ": " + range.message());
            break;
        }
        exif.entries.push_back(exif_ifd_entry{u16(entry), u16(entry + 2), u32(entry + 4), u32(entry + 8)});
    }
    info.exif = std::move(exif);
}

void parse_app(jpeg_marker marker, std::span<const std::uint8_t> payload, jpeg_info& info) {
    auto starts_with = [&](std::string_view tag) {
        return payload.size() >= tag.size() &&
               std::memcmp(payload.data(), tag.data(), tag.size()) == 0;
    };

    if (marker == jpeg_marker::app0 && starts_with(std::string_view("JFIF\0", 5))) {
        parse_jfif(payload, info);
    } else if (marker == jpeg_marker::app1 && starts_with(std::string_view("Exif\0\0", 6))) {
        parse_exif(payload, info);
    } else if (marker == jpeg_marker::app14 && starts_with("Adobe")) {
        if (payload.size() < 12) {
            log_warn("JPEG: Adobe segment too short");
            return;
        }
        info.adobe_transform = payload[11];
    } else {
        log_debug(std::string("JPEG: skipping ") + to_string(marker) + " segment of " +
                  std::to_string(payload.size()) + " bytes");
    }
}

result<jpeg_scan_info> parse_sos_header(bit_reader& seg, const jpeg_info& info) {
    if (!info.frame_marker) {
        return failure(decode_error::invalid_data, "SOS before SOF");
    }

    auto count = seg.read_u8();
    if (!count) {
        return count.error_info();
    }
    if (count.value() < 1 || count.value() > 4) {
        return failure(decode_error::invalid_data,
            "scan with " + std::to_string(count.value()) + " components");
    }

    jpeg_scan_info scan;
    for (unsigned i = 0; i < count.value(); ++i) {
        auto id = seg.read_u8();
        if (!id) {
            return id.error_info();
        }
        auto tables = seg.read_u8();
        if (!tables) {
            return tables.error_info();
        }
        if (!find_component(info, id.value())) {
            return failure(decode_error::invalid_data,
                "scan references unknown component " + std::to_string(id.value()));
        }
        scan.components.push_back(jpeg_scan_component{
            id.value(),
            static_cast<std::uint8_t>(tables.value() >> 4),
            static_cast<std::uint8_t>(tables.value() & 0x0F)});
    }

    auto ss = seg.read_u8();
    if (!ss) {
        return ss.error_info();
    }
    auto se = seg.read_u8();
    if (!se) {
        return se.error_info();
    }
    auto a = seg.read_u8();
    if (!a) {
        return a.error_info();
    }
    scan.spectral_start = ss.value();
    scan.spectral_end = se.value();
    scan.approx_high = a.value() >> 4;
    scan.approx_low = a.value() & 0x0F;

    if (info.mode == jpeg_mode::lossless) {
        if (scan.spectral_start > 7) {
            return failure(decode_error::invalid_data,
                "lossless predictor " + std::to_string(scan.spectral_start) + " outside 0..7");
        }
        if (scan.approx_low >= info.precision) {
            return failure(decode_error::invalid_data, "lossless point transform exceeds precision");
        }
    } else if (info.mode == jpeg_mode::progressive) {
        if (scan.spectral_start > scan.spectral_end || scan.spectral_end > 63 ||
            (scan.spectral_start == 0 && scan.spectral_end != 0) ||
            (scan.spectral_start > 0 && scan.components.size() != 1) ||
            scan.approx_low > 13) {
            return failure(decode_error::invalid_data,
                "invalid progressive scan parameters Ss=" + std::to_string(scan.spectral_start) +
                " Se=" + std::to_string(scan.spectral_end) +
                " Ah=" + std::to_string(scan.approx_high) +
                " Al=" + std::to_string(scan.approx_low));
        }
    } else {
        // Sequential scans always cover the whole block
        scan.spectral_start = 0;
        scan.spectral_end = 63;
    }
    return scan;
}

// Entropy-coded data up to the next non-RST marker, unstuffed and split at
// restart markers. The reader is left on the marker.
result<std::vector<std::vector<std::uint8_t>>> read_entropy_segments(bit_reader& reader) {
    std::vector<std::vector<std::uint8_t>> segments(1);

    auto truncated = [&]() {
        log_warn("JPEG: entropy-coded data truncated at offset " + std::to_string(reader.position()));
        return segments;
    };

    for (;;) {
        auto byte = reader.read_u8();
        if (!byte) {
            if (byte.code() == decode_error::unexpected_eof) {
                return truncated();
            }
            return byte.error_info();
        }
        if (byte.value() != 0xFF) {
            segments.back().push_back(byte.value());
            continue;
        }

        auto next = reader.read_u8();
        while (next && next.value() == 0xFF) {
            next = reader.read_u8();  // fill bytes
        }
        if (!next) {
            if (next.code() == decode_error::unexpected_eof) {
                return truncated();
            }
            return next.error_info();
        }

        if (next.value() == 0x00) {
            segments.back().push_back(0xFF);
        } else if (next.value() >= 0xD0 && next.value() <= 0xD7) {
            segments.emplace_back();
        } else {
            auto back = reader.seek(reader.position() - 2);
            if (!back) {
                return back.error_info();
            }
            return segments;
        }
    }
}

// ============================================================================
// Scan decoding
// ============================================================================

const jpeg_huffman_table* find_huffman(const jpeg_info& info, std::uint8_t table_class, std::uint8_t id) {
    for (const auto& t : info.huffman_tables) {
        if (t.table_class == table_class && t.id == id) {
            return &t;
        }
    }
    return nullptr;
}

status decode_dct_scan(const jpeg_info& info, const jpeg_scan_info& scan, frame_layout& layout,
                       const std::vector<std::vector<std::uint8_t>>& segments) {
    const bool progressive = info.mode == jpeg_mode::progressive;
    const std::size_t ns = scan.components.size();

    std::vector<std::size_t> comp_index(ns);
    for (std::size_t i = 0; i < ns; ++i) {
        comp_index[i] = *find_component(info, scan.components[i].component_id);
    }

    scan_tables tables;
    std::vector<huffman_lookup> lookups;
    lookups.reserve(2 * ns);
    tables.dc.assign(ns, nullptr);
    tables.ac.assign(ns, nullptr);

    const bool needs_dc = !progressive || (scan.spectral_start == 0 && scan.approx_high == 0);
    const bool needs_ac = !progressive || scan.spectral_start > 0;

    for (std::size_t i = 0; i < ns; ++i) {
        const auto& sc = scan.components[i];
        tables.dc_ids.push_back(sc.dc_table);
        tables.ac_ids.push_back(sc.ac_table);

        if (info.coding == jpeg_coding::arithmetic) {
            if ((needs_dc && sc.dc_table > 3) || (needs_ac && sc.ac_table > 3)) {
                return failure(decode_error::invalid_data,
                    "scan references arithmetic conditioning table above 3");
            }
            continue;
        }

        if (needs_dc) {
            const auto* dc = find_huffman(info, 0, sc.dc_table);
            if (dc == nullptr) {
                return failure(decode_error::invalid_data,
                    "scan references undefined DC Huffman table " + std::to_string(sc.dc_table));
            }
            lookups.push_back(jpeg_detail::build_lookup(*dc));
            tables.dc[i] = &lookups.back();
        }
        if (needs_ac) {
            const auto* ac = find_huffman(info, 1, sc.ac_table);
            if (ac == nullptr) {
                return failure(decode_error::invalid_data,
                    "scan references undefined AC Huffman table " + std::to_string(sc.ac_table));
            }
            lookups.push_back(jpeg_detail::build_lookup(*ac));
            tables.ac[i] = &lookups.back();
        }
    }

    std::unique_ptr<jpeg_detail::entropy_decoder> decoder;
    if (info.coding == jpeg_coding::arithmetic) {
        decoder = jpeg_detail::make_arithmetic_decoder(scan, progressive, std::move(tables),
                                                       jpeg_detail::make_conditioning(info));
    } else {
        decoder = jpeg_detail::make_huffman_decoder(scan, progressive, std::move(tables));
    }

    // A single-component scan is non-interleaved: one block per MCU over the
    // component's own block grid.
    std::size_t mcus_x = layout.mcus_x;
    std::size_t mcus_y = layout.mcus_y;
    if (ns == 1) {
        const auto& plane = layout.planes[comp_index[0]];
        mcus_x = (plane.width + 7) / 8;
        mcus_y = (plane.height + 7) / 8;
    }

    const std::size_t interval = info.restart_interval;
    std::size_t segment = 0;
    std::size_t in_segment = 0;
    bool skipping = false;
    std::vector<mcu_block> blocks;
    decoder->start_segment(segments[0]);

    for (std::size_t mcu = 0; mcu < mcus_x * mcus_y; ++mcu) {
        if (interval > 0 && in_segment == interval) {
            ++segment;
            in_segment = 0;
            skipping = false;
            if (segment >= segments.size()) {
                log_warn("JPEG: scan ends after " + std::to_string(segments.size()) +
                         " restart intervals, remaining blocks left empty");
                return {};
            }
            decoder->start_segment(segments[segment]);
        }
        ++in_segment;
        if (skipping) {
            continue;
        }

        const std::size_t mx = mcu % mcus_x;
        const std::size_t my = mcu / mcus_x;
        blocks.clear();
        if (ns == 1) {
            blocks.push_back(mcu_block{0, layout.planes[comp_index[0]].block(mx, my)});
        } else {
            for (std::size_t i = 0; i < ns; ++i) {
                auto& plane = layout.planes[comp_index[i]];
                const auto& comp = info.components[comp_index[i]];
                for (std::size_t v = 0; v < comp.v_sampling; ++v) {
                    for (std::size_t h = 0; h < comp.h_sampling; ++h) {
                        blocks.push_back(mcu_block{i, plane.block(mx * comp.h_sampling + h,
                                                                  my * comp.v_sampling + v)});
                    }
                }
            }
        }

        auto st = decoder->decode_mcu(blocks);
        if (!st) {
            if (interval == 0) {
                log_warn("JPEG: " + st.message() + " at MCU " + std::to_string(mcu) +
                         ", remaining blocks of the scan left as decoded");
                return {};
            }
            log_warn("JPEG: " + st.message() + " at MCU " + std::to_string(mcu) +
                     ", skipping to the next restart interval");
            skipping = true;
        }
    }
    return {};
}

std::int32_t lossless_predict(int predictor, std::int32_t ra, std::int32_t rb, std::int32_t rc) {
    switch (predictor) {
        case 1: return ra;
        case 2: return rb;
        case 3: return rc;
        case 4: return ra + rb - rc;
        case 5: return ra + ((rb - rc) >> 1);
        case 6: return rb + ((ra - rc) >> 1);
        case 7: return (ra + rb) / 2;
        default: return 0;
    }
}

status decode_lossless_scan(const jpeg_info& info, const jpeg_scan_info& scan,
                            std::vector<std::vector<std::int32_t>>& samples,
                            const std::vector<std::vector<std::uint8_t>>& segments) {
    if (info.coding != jpeg_coding::huffman) {
        return failure(decode_error::unsupported_format, "arithmetic lossless frames are not supported");
    }

    const std::size_t ns = scan.components.size();
    std::vector<std::size_t> comp_index(ns);
    std::vector<huffman_lookup> lookups;
    for (std::size_t i = 0; i < ns; ++i) {
        comp_index[i] = *find_component(info, scan.components[i].component_id);
        const auto* table = find_huffman(info, 0, scan.components[i].dc_table);
        if (table == nullptr) {
            return failure(decode_error::invalid_data,
                "lossless scan references undefined Huffman table " +
                std::to_string(scan.components[i].dc_table));
        }
        lookups.push_back(jpeg_detail::build_lookup(*table));
    }

    const std::size_t width = info.width;
    const std::size_t height = info.height;
    const int predictor = scan.spectral_start;
    const std::int32_t initial = 1 << (info.precision - scan.approx_low - 1);
    const std::size_t interval = info.restart_interval;

    std::size_t segment = 0;
    std::size_t in_segment = 0;
    std::size_t first_row = 0;   // first line of the current restart interval
    bool reset_pending = true;
    bool skipping = false;
    std::optional<bit_reader> reader;
    reader.emplace(std::span<const std::uint8_t>(segments[0]));

    for (std::size_t pos = 0; pos < width * height; ++pos) {
        const std::size_t x = pos % width;
        const std::size_t y = pos / width;

        if (interval > 0 && in_segment == interval) {
            ++segment;
            in_segment = 0;
            if (segment >= segments.size()) {
                log_warn("JPEG: lossless scan ends early, remaining samples left empty");
                return {};
            }
            reader.emplace(std::span<const std::uint8_t>(segments[segment]));
            first_row = y;
            reset_pending = true;
            skipping = false;
        }
        ++in_segment;
        if (skipping) {
            continue;
        }

        for (std::size_t i = 0; i < ns; ++i) {
            auto& plane = samples[comp_index[i]];

            auto ssss = jpeg_detail::decode_symbol(*reader, lookups[i]);
            std::int32_t diff = 0;
            status st;
            if (!ssss) {
                st = ssss.error_info();
            } else if (ssss.value() == 16) {
                diff = 32768;
            } else if (ssss.value() > 16) {
                st = failure(decode_error::invalid_data,
                    "lossless difference category " + std::to_string(ssss.value()));
            } else if (ssss.value() > 0) {
                auto bits = reader->read_bits(ssss.value());
                if (!bits) {
                    st = bits.error_info();
                } else {
                    diff = jpeg_detail::extend(bits.value(), ssss.value());
                }
            }
            if (!st) {
                log_warn("JPEG: " + st.message() + " at sample " + std::to_string(pos) +
                         (interval > 0 ? ", skipping to the next restart interval"
                                       : ", remaining samples left empty"));
                if (interval == 0) {
                    return {};
                }
                skipping = true;
                break;
            }

            std::int32_t prediction = 0;
            if (reset_pending) {
                prediction = initial;
            } else if (y == first_row) {
                prediction = x > 0 ? plane[pos - 1] : plane[pos - width];
            } else if (x == 0) {
                prediction = plane[pos - width];
            } else {
                prediction = lossless_predict(predictor, plane[pos - 1], plane[pos - width],
                                              plane[pos - width - 1]);
            }
            plane[pos] = (prediction + diff) & 0xFFFF;
        }
        reset_pending = false;
    }
    return {};
}

// ============================================================================
// Reconstruction
// ============================================================================

class pixel_writer {
public:
    pixel_writer(std::size_t count, int precision)
        : max_(static_cast<std::uint32_t>((1 << precision) - 1)), wide_(precision > 8) {
        if (wide_) {
            out16_.reserve(count);
        } else {
            out8_.reserve(count);
        }
    }

    void put(std::int32_t value) {
        const auto v = static_cast<std::uint32_t>(std::clamp<std::int32_t>(value, 0, static_cast<std::int32_t>(max_)));
        if (wide_) {
            out16_.push_back(scale_to_16(v, max_));
        } else {
            out8_.push_back(scale_to_8(v, max_));
        }
    }

    result<image> finish(std::uint32_t width, std::uint32_t height, bool color) {
        if (wide_) {
            return image::from_pixels16(width, height, color ? pixel_format::rgb16 : pixel_format::l16,
                                        std::move(out16_));
        }
        return image::from_pixels(width, height, color ? pixel_format::rgb8 : pixel_format::l8,
                                  std::move(out8_));
    }

private:
    std::uint32_t max_;
    bool wide_;
    std::vector<std::uint8_t> out8_;
    std::vector<std::uint16_t> out16_;
};

result<image> reconstruct_dct(const jpeg_info& info, frame_layout& layout) {
    const std::size_t nc = info.components.size();
    if (nc == 2) {
        return failure(decode_error::unsupported_format, "two-component JPEG color spaces are not supported");
    }

    // Dequantize, transform and store samples per plane at block resolution
    std::vector<std::vector<std::int32_t>> planes(nc);
    std::vector<std::size_t> strides(nc);
    for (std::size_t ci = 0; ci < nc; ++ci) {
        auto& plane = layout.planes[ci];
        const auto qid = info.components[ci].quant_table_id;
        auto it = std::find_if(info.quantization_tables.begin(), info.quantization_tables.end(),
                               [&](const auto& t) { return t.id == qid; });
        if (it == info.quantization_tables.end()) {
            return failure(decode_error::invalid_data,
                "component " + std::to_string(info.components[ci].id) +
                " references undefined quantization table " + std::to_string(qid));
        }

        strides[ci] = plane.blocks_per_line * 8;
        planes[ci].assign(strides[ci] * plane.block_lines * 8, 0);
        for (std::size_t by = 0; by < plane.block_lines; ++by) {
            for (std::size_t bx = 0; bx < plane.blocks_per_line; ++bx) {
                std::int32_t* coef = plane.block(bx, by);
                jpeg_detail::dequantize_block(coef, it->values);
                jpeg_detail::inverse_dct_block(coef, planes[ci].data() + by * 8 * strides[ci] + bx * 8,
                                               strides[ci], info.precision);
            }
        }
        plane.coefficients.clear();
        plane.coefficients.shrink_to_fit();
    }

    // Nearest-neighbour upsampling
    auto sample = [&](std::size_t ci, std::size_t x, std::size_t y) {
        const auto& c = info.components[ci];
        const std::size_t sx = x * c.h_sampling / static_cast<std::size_t>(layout.h_max);
        const std::size_t sy = y * c.v_sampling / static_cast<std::size_t>(layout.v_max);
        return planes[ci][sy * strides[ci] + sx];
    };

    const std::uint32_t width = info.width;
    const std::uint32_t height = info.height;
    const std::int32_t max_sample = (1 << info.precision) - 1;
    const double center = static_cast<double>(1 << (info.precision - 1));
    pixel_writer out(static_cast<std::size_t>(width) * height * (nc == 1 ? 1 : 3), info.precision);

    auto ycc_to_rgb = [&](std::int32_t y, std::int32_t cb, std::int32_t cr, std::int32_t* rgb) {
        const double fy = y;
        const double fcb = cb - center;
        const double fcr = cr - center;
        rgb[0] = std::clamp<std::int32_t>(static_cast<std::int32_t>(std::lround(fy + 1.402 * fcr)), 0, max_sample);
        rgb[1] = std::clamp<std::int32_t>(
            static_cast<std::int32_t>(std::lround(fy - 0.344136 * fcb - 0.714136 * fcr)), 0, max_sample);
        rgb[2] = std::clamp<std::int32_t>(static_cast<std::int32_t>(std::lround(fy + 1.772 * fcb)), 0, max_sample);
    };

    const bool rgb_components = nc == 3 && info.components[0].id == 'R' &&
                                info.components[1].id == 'G' && info.components[2].id == 'B';
    const bool untransformed = info.adobe_transform.has_value() && *info.adobe_transform == 0;

    for (std::size_t y = 0; y < height; ++y) {
        for (std::size_t x = 0; x < width; ++x) {
            if (nc == 1) {
                out.put(sample(0, x, y));
                continue;
            }

            std::int32_t rgb[3];
            if (nc == 3) {
                if (untransformed || (!info.adobe_transform && rgb_components)) {
                    rgb[0] = sample(0, x, y);
                    rgb[1] = sample(1, x, y);
                    rgb[2] = sample(2, x, y);
                } else {
                    ycc_to_rgb(sample(0, x, y), sample(1, x, y), sample(2, x, y), rgb);
                }
            } else {
                // CMYK; Adobe files store inverted ink values
                std::int32_t cmy[3] = {sample(0, x, y), sample(1, x, y), sample(2, x, y)};
                std::int32_t k = sample(3, x, y);
                if (info.adobe_transform && *info.adobe_transform == 2) {
                    std::int32_t ycc[3];
                    ycc_to_rgb(cmy[0], cmy[1], cmy[2], ycc);
                    for (int i = 0; i < 3; ++i) {
                        cmy[i] = max_sample - ycc[i];
                    }
                }
                if (!info.adobe_transform) {
                    for (auto& v : cmy) {
                        v = max_sample - v;
                    }
                    k = max_sample - k;
                }
                for (int i = 0; i < 3; ++i) {
                    rgb[i] = (cmy[i] * k + max_sample / 2) / max_sample;
                }
            }
            out.put(rgb[0]);
            out.put(rgb[1]);
            out.put(rgb[2]);
        }
    }
    return out.finish(width, height, nc != 1);
}

result<image> reconstruct_lossless(const jpeg_info& info, const std::vector<std::vector<std::int32_t>>& samples) {
    const std::size_t nc = info.components.size();
    if (nc != 1 && nc != 3) {
        return failure(decode_error::unsupported_format,
            "lossless frames with " + std::to_string(nc) + " components are not supported");
    }

    // The point transform of the last scan applies to all samples
    const int pt = info.scans.empty() ? 0 : info.scans.back().approx_low;
    const std::int32_t mask = (1 << info.precision) - 1;
    const std::size_t count = static_cast<std::size_t>(info.width) * info.height;

    pixel_writer out(count * nc, info.precision);
    for (std::size_t i = 0; i < count; ++i) {
        for (std::size_t c = 0; c < nc; ++c) {
            out.put((samples[c][i] << pt) & mask);
        }
    }
    return out.finish(info.width, info.height, nc == 3);
}

} // namespace

// ============================================================================
// Decoder
// ============================================================================

bool jpeg_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
}

jpeg_decoder::jpeg_decoder(std::unique_ptr<byte_source> source, const decode_options& options)
    : reader_(std::move(source)), options_(options) {}

jpeg_decoder::~jpeg_decoder() = default;

status jpeg_decoder::process_scan(std::vector<std::uint8_t> header, bool decode_scans) {
    bit_reader seg(std::move(header));
    auto parsed = parse_sos_header(seg, info_);
    if (!parsed) {
        return parsed.error_info();
    }
    jpeg_scan_info scan = std::move(parsed.value());

    auto segments = read_entropy_segments(reader_);
    if (!segments) {
        return segments.error_info();
    }
    for (const auto& s : segments.value()) {
        scan.data_length += s.size();
    }
    scan.segments = segments.value().size();
    info_.scans.push_back(scan);

    if (!decode_scans) {
        return {};
    }
    if (!frame_) {
        return failure(decode_error::internal_error, "scan decoded without a frame");
    }
    if (info_.mode == jpeg_mode::lossless) {
        return decode_lossless_scan(info_, scan, frame_->samples, segments.value());
    }
    return decode_dct_scan(info_, scan, frame_->layout, segments.value());
}

status jpeg_decoder::process_segment(jpeg_marker marker, bool decode_scans) {
    if (marker == jpeg_marker::soi || marker == jpeg_marker::tem || is_rst(marker)) {
        log_debug(std::string("JPEG: stray ") + to_string(marker) + " marker");
        return {};
    }

    auto payload = read_segment_payload(reader_, marker);
    if (!payload) {
        return payload.error_info();
    }

    switch (marker) {
        case jpeg_marker::sof0: case jpeg_marker::sof1: case jpeg_marker::sof2: case jpeg_marker::sof3:
        case jpeg_marker::sof5: case jpeg_marker::sof6: case jpeg_marker::sof7:
        case jpeg_marker::sof9: case jpeg_marker::sof10: case jpeg_marker::sof11:
        case jpeg_marker::sof13: case jpeg_marker::sof14: case jpeg_marker::sof15: {
            bit_reader seg(std::move(payload.value()));
            auto st = parse_sof(marker, seg, info_, options_);
            if (!st || !decode_scans) {
                return st;
            }
            frame_ = std::make_unique<frame_state>();
            if (info_.mode == jpeg_mode::lossless) {
                frame_->samples.assign(info_.components.size(),
                    std::vector<std::int32_t>(static_cast<std::size_t>(info_.width) * info_.height, 0));
            } else {
                frame_->layout = jpeg_detail::make_frame_layout(info_);
            }
            return {};
        }
        case jpeg_marker::dht: {
            bit_reader seg(std::move(payload.value()));
            return parse_dht(seg, info_);
        }
        case jpeg_marker::dac: {
            bit_reader seg(std::move(payload.value()));
            return parse_dac(seg, info_);
        }
        case jpeg_marker::dqt: {
            bit_reader seg(std::move(payload.value()));
            return parse_dqt(seg, info_);
        }
        case jpeg_marker::dri: {
            bit_reader seg(std::move(payload.value()));
            return parse_dri(seg, info_);
        }
        case jpeg_marker::sos:
            return process_scan(std::move(payload.value()), decode_scans);
        case jpeg_marker::com:
            info_.comments.emplace_back(payload.value().begin(), payload.value().end());
            return {};
        case jpeg_marker::dnl:
            log_warn("JPEG: ignoring DNL segment");
            return {};
        default:
            if (marker_to_u16(marker) >= 0xFFE0 && marker_to_u16(marker) <= 0xFFEF) {
                parse_app(marker, payload.value(), info_);
            } else {
                log_debug(std::string("JPEG: skipping ") + to_string(marker) + " segment");
            }
            return {};
    }
}

result<image> jpeg_decoder::decode() {
    auto rewind = reader_.reset();
    if (!rewind) {
        return rewind.error_info();
    }
    info_ = jpeg_info{};
    frame_.reset();
    decoded_ = false;

    auto soi = reader_.read_u16();
    if (!soi) {
        return soi.error_info();
    }
    if (soi.value() != 0xFFD8) {
        return failure(decode_error::invalid_format, "missing SOI marker");
    }

    bool seen_eoi = false;
    for (;;) {
        auto marker = reader_.next_marker(jpeg_known_markers());
        if (!marker) {
            return marker.error_info();
        }
        if (!marker.value()) {
            break;
        }
        if (*marker.value() == jpeg_marker::eoi) {
            seen_eoi = true;
            break;
        }
        auto st = process_segment(*marker.value(), true);
        if (!st) {
            return st.error_info();
        }
    }
    decoded_ = true;
    headers_parsed_ = true;

    if (!seen_eoi) {
        log_warn("JPEG: stream ended without EOI marker");
    }
    if (!info_.frame_marker || !frame_) {
        return failure(decode_error::invalid_data, "no SOF segment found");
    }
    if (info_.scans.empty()) {
        return failure(decode_error::invalid_data, "no SOS segment found");
    }

    if (info_.mode == jpeg_mode::lossless) {
        return reconstruct_lossless(info_, frame_->samples);
    }
    return reconstruct_dct(info_, frame_->layout);
}

status jpeg_decoder::parse_headers_only() {
    auto rewind = reader_.reset();
    if (!rewind) {
        return rewind;
    }
    info_ = jpeg_info{};
    headers_parsed_ = true;

    auto soi = reader_.read_u16();
    if (!soi) {
        return soi.error_info();
    }
    if (soi.value() != 0xFFD8) {
        return failure(decode_error::invalid_format, "missing SOI marker");
    }

    for (;;) {
        auto marker = reader_.next_marker(jpeg_known_markers());
        if (!marker) {
            return marker.error_info();
        }
        if (!marker.value() || *marker.value() == jpeg_marker::eoi) {
            break;
        }
        auto st = process_segment(*marker.value(), false);
        if (!st) {
            return st;
        }
    }
    return reader_.reset();
}

image_info jpeg_decoder::get_image_info() {
    if (!headers_parsed_) {
        auto st = parse_headers_only();
        if (!st) {
            log_warn("JPEG: header parsing stopped: " + st.message());
            auto rewind = reader_.reset();
            if (!rewind) {
                log_warn("JPEG: " + rewind.message());
            }
        }
    }
    return image_info{info_};
}

} // namespace vexel

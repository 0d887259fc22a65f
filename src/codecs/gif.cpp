#include <vexel/codecs/gif.hpp>
#include <vexel/info.hpp>
#include <vexel/log.hpp>
#include <vexel/safe_access.hpp>

#include "byte_io.hpp"
#include "decode_helpers.hpp"
#include "gif_internal.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <string>
#include <utility>

namespace vexel {

// ============================================================================
// LZW
// ============================================================================

namespace gif_detail {

result<std::vector<std::uint8_t>> lzw_decode(std::span<const std::uint8_t> data,
                                             unsigned min_code_size,
                                             std::size_t pixel_count) {
    if (min_code_size < 2 || min_code_size > 11) {
        return failure(decode_error::invalid_data,
            "LZW minimum code size " + std::to_string(min_code_size) + " outside 2..11");
    }

    const std::uint32_t clear_code = 1u << min_code_size;
    const std::uint32_t end_code = clear_code + 1;

    std::vector<std::uint16_t> prefix(LZW_TABLE_SIZE, 0);
    std::vector<std::uint8_t> suffix(LZW_TABLE_SIZE, 0);
    std::vector<std::uint8_t> first(LZW_TABLE_SIZE, 0);
    std::vector<std::uint16_t> length(LZW_TABLE_SIZE, 0);
    for (std::uint32_t i = 0; i < clear_code; ++i) {
        suffix[i] = static_cast<std::uint8_t>(i);
        first[i] = static_cast<std::uint8_t>(i);
        length[i] = 1;
    }

    unsigned code_size = min_code_size + 1;
    std::uint32_t next_code = end_code + 1;
    std::int32_t prev = -1;

    std::vector<std::uint8_t> out;
    out.reserve(pixel_count);

    std::uint32_t acc = 0;
    unsigned bits = 0;
    std::size_t pos = 0;
    bool saw_end = false;

    while (out.size() < pixel_count) {
        while (bits < code_size && pos < data.size()) {
            acc |= static_cast<std::uint32_t>(data[pos++]) << bits;
            bits += 8;
        }
        if (bits < code_size) {
            break;
        }
        const std::uint32_t code = acc & ((1u << code_size) - 1);
        acc >>= code_size;
        bits -= code_size;

        if (code == clear_code) {
            code_size = min_code_size + 1;
            next_code = end_code + 1;
            prev = -1;
            continue;
        }
        if (code == end_code) {
            saw_end = true;
            break;
        }

        if (prev < 0) {
            if (code >= clear_code) {
                return failure(decode_error::invalid_data,
                    "LZW code " + std::to_string(code) + " after clear is not a literal");
            }
            out.push_back(static_cast<std::uint8_t>(code));
            prev = static_cast<std::int32_t>(code);
            continue;
        }

        if (code > next_code) {
            return failure(decode_error::invalid_data,
                "LZW code " + std::to_string(code) + " exceeds next free code " +
                std::to_string(next_code));
        }

        if (next_code < LZW_TABLE_SIZE) {
            const auto p = static_cast<std::uint16_t>(prev);
            prefix[next_code] = p;
            suffix[next_code] = code < next_code ? first[code] : first[p];
            first[next_code] = first[p];
            length[next_code] = static_cast<std::uint16_t>(length[p] + 1);
            ++next_code;
            if (next_code == (1u << code_size) && code_size < LZW_MAX_BITS) {
                ++code_size;
            }
        }

        // Walk the prefix chain backwards into place
        const std::size_t len = length[code];
        const std::size_t base = out.size();
        out.resize(base + len);
        std::uint32_t c = code;
        for (std::size_t i = len; i-- > 0;) {
            out[base + i] = suffix[c];
            c = prefix[c];
        }
        prev = static_cast<std::int32_t>(code);
    }

    if (out.size() > pixel_count) {
        out.resize(pixel_count);
    } else if (out.size() < pixel_count) {
        log_warn("GIF: LZW data ended after " + std::to_string(out.size()) + " of " +
                 std::to_string(pixel_count) + " pixels");
        out.resize(pixel_count, 0);
    } else if (!saw_end && pos < data.size()) {
        log_debug("GIF: " + std::to_string(data.size() - pos) + " bytes after last pixel ignored");
    }
    return out;
}

std::vector<std::uint8_t> deinterlace(std::span<const std::uint8_t> rows,
                                      std::size_t row_bytes,
                                      std::size_t height) {
    static constexpr std::array<std::pair<std::size_t, std::size_t>, 4> passes = {{
        {0, 8}, {4, 8}, {2, 4}, {1, 2}
    }};

    std::vector<std::uint8_t> out(rows.size(), 0);
    std::size_t src_row = 0;
    for (const auto& [start, step] : passes) {
        for (std::size_t y = start; y < height; y += step) {
            if ((src_row + 1) * row_bytes > rows.size()) {
                return out;
            }
            std::memcpy(out.data() + y * row_bytes, rows.data() + src_row * row_bytes, row_bytes);
            ++src_row;
        }
    }
    return out;
}

} // namespace gif_detail

const char* to_string(gif_disposal disposal) noexcept {
    switch (disposal) {
        case gif_disposal::unspecified: return "unspecified";
        case gif_disposal::keep:        return "keep";
        case gif_disposal::background:  return "restore to background";
        case gif_disposal::previous:    return "restore to previous";
    }
    return "reserved";
}

namespace {

constexpr std::uint8_t GIF_EXTENSION_INTRODUCER = 0x21;
constexpr std::uint8_t GIF_IMAGE_SEPARATOR = 0x2C;
constexpr std::uint8_t GIF_TRAILER = 0x3B;

constexpr std::uint8_t GIF_LABEL_PLAIN_TEXT = 0x01;
constexpr std::uint8_t GIF_LABEL_GRAPHIC_CONTROL = 0xF9;
constexpr std::uint8_t GIF_LABEL_COMMENT = 0xFE;
constexpr std::uint8_t GIF_LABEL_APPLICATION = 0xFF;

// Delay used for frames without a graphic control extension
constexpr std::uint32_t GIF_DEFAULT_DELAY_MS = 100;

// Read a sub-block sequence up to and including its zero-length terminator.
result<std::vector<std::vector<std::uint8_t>>> read_sub_blocks(bit_reader& reader) {
    std::vector<std::vector<std::uint8_t>> blocks;
    for (;;) {
        auto size = reader.read_u8();
        if (!size) {
            return size.error_info();
        }
        if (size.value() == 0) {
            return blocks;
        }
        auto block = reader.read_vector(size.value());
        if (!block) {
            return block.error_info();
        }
        blocks.push_back(std::move(block.value()));
    }
}

std::string join_blocks(const std::vector<std::vector<std::uint8_t>>& blocks, std::size_t from) {
    std::string text;
    for (std::size_t i = from; i < blocks.size(); ++i) {
        text.append(blocks[i].begin(), blocks[i].end());
    }
    return text;
}

result<std::vector<std::uint8_t>> read_color_table(bit_reader& reader, std::size_t entries) {
    return reader.read_vector(entries * 3);
}

void parse_application(const std::vector<std::vector<std::uint8_t>>& blocks, gif_info& info) {
    gif_application_extension app;
    if (blocks.empty() || blocks[0].size() != 11) {
        log_warn("GIF: application extension header is not 11 bytes");
        if (blocks.empty()) {
            return;
        }
    }
    const auto& header = blocks[0];
    app.identifier.assign(header.begin(), header.begin() + std::min<std::size_t>(8, header.size()));
    if (header.size() > 8) {
        app.auth_code.assign(header.begin() + 8, header.begin() + std::min<std::size_t>(11, header.size()));
    }

    const bool looping = (app.identifier == "NETSCAPE" && app.auth_code == "2.0") ||
                         (app.identifier == "ANIMEXTS" && app.auth_code == "1.0");
    for (std::size_t i = 1; i < blocks.size(); ++i) {
        const auto& block = blocks[i];
        if (looping && block.size() >= 3 && block[0] == 1) {
            app.loop_count = read_le16(block.data() + 1);
        } else if (looping && block.size() >= 5 && block[0] == 2) {
            app.buffer_size = read_le32(block.data() + 1);
        } else {
            app.data.insert(app.data.end(), block.begin(), block.end());
        }
    }
    info.app_extensions.push_back(std::move(app));
}

void parse_plain_text(const std::vector<std::vector<std::uint8_t>>& blocks, gif_info& info) {
    if (blocks.empty() || blocks[0].size() < 12) {
        log_warn("GIF: plain text extension header is shorter than 12 bytes, skipped");
        return;
    }
    const std::uint8_t* p = blocks[0].data();
    gif_plain_text_extension text;
    text.left = read_le16(p);
    text.top = read_le16(p + 2);
    text.width = read_le16(p + 4);
    text.height = read_le16(p + 6);
    text.cell_width = p[8];
    text.cell_height = p[9];
    text.foreground_color = p[10];
    text.background_color = p[11];
    text.text = join_blocks(blocks, 1);
    info.plain_text_extensions.push_back(std::move(text));
}

} // namespace

// ============================================================================
// GIF Decoder
// ============================================================================

bool gif_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < 6) {
        return false;
    }
    return std::memcmp(data.data(), "GIF87a", 6) == 0 || std::memcmp(data.data(), "GIF89a", 6) == 0;
}

gif_decoder::gif_decoder(std::unique_ptr<byte_source> source, const decode_options& options)
    : reader_(std::move(source)), options_(options) {}

status gif_decoder::read_header() {
    std::uint8_t header[13];
    auto st = reader_.read_bytes(header);
    if (!st) {
        return st;
    }
    if (!sniff(header)) {
        return failure(decode_error::invalid_format, "missing GIF87a/GIF89a signature");
    }

    info_.version.assign(header + 3, header + 6);
    info_.canvas_width = read_le16(header + 6);
    info_.canvas_height = read_le16(header + 8);
    const std::uint8_t packed = header[10];
    info_.global_color_table_flag = (packed & 0x80) != 0;
    info_.color_resolution = (packed >> 4) & 0x07;
    info_.sort_flag = (packed & 0x08) != 0;
    info_.background_color_index = header[11];
    info_.pixel_aspect_ratio = header[12];

    if (info_.global_color_table_flag) {
        info_.global_color_table_size = std::size_t{1} << ((packed & 0x07) + 1);
        auto table = read_color_table(reader_, info_.global_color_table_size);
        if (!table) {
            return table.error_info();
        }
        info_.global_color_table = std::move(table.value());
    }

    log_debug("GIF" + info_.version + ": canvas " + std::to_string(info_.canvas_width) + "x" +
              std::to_string(info_.canvas_height));
    return {};
}

status gif_decoder::read_extension(std::optional<gif_frame_info>& control) {
    auto label = reader_.read_u8();
    if (!label) {
        return label.error_info();
    }
    auto blocks = read_sub_blocks(reader_);
    if (!blocks) {
        return blocks.error_info();
    }
    const auto& list = blocks.value();

    switch (label.value()) {
        case GIF_LABEL_GRAPHIC_CONTROL: {
            if (list.empty() || list[0].size() < 4) {
                log_warn("GIF: graphic control extension shorter than 4 bytes, ignored");
                break;
            }
            const auto& gce = list[0];
            gif_frame_info fc;
            fc.has_graphic_control = true;
            const unsigned disposal = (gce[0] >> 2) & 0x07;
            if (disposal > 3) {
                log_warn("GIF: reserved disposal method " + std::to_string(disposal));
            }
            fc.disposal = disposal > 3 ? gif_disposal::unspecified : static_cast<gif_disposal>(disposal);
            fc.user_input = (gce[0] & 0x02) != 0;
            fc.delay_ms = static_cast<std::uint32_t>(read_le16(gce.data() + 1)) * 10;
            if ((gce[0] & 0x01) != 0) {
                fc.transparent_index = gce[3];
            }
            control = std::move(fc);
            break;
        }
        case GIF_LABEL_COMMENT:
            info_.comments.push_back(join_blocks(list, 0));
            break;
        case GIF_LABEL_APPLICATION:
            parse_application(list, info_);
            break;
        case GIF_LABEL_PLAIN_TEXT:
            parse_plain_text(list, info_);
            // A graphic control extension applies to the next graphic rendering block
            control.reset();
            break;
        default:
            log_warn("GIF: skipping unknown extension label " + std::to_string(label.value()));
            break;
    }
    return {};
}

status gif_decoder::read_image_descriptor(std::optional<gif_frame_info> control) {
    std::uint8_t desc[9];
    auto st = reader_.read_bytes(desc);
    if (!st) {
        return st;
    }

    gif_frame_info frame = control.value_or(gif_frame_info{});
    if (!frame.has_graphic_control) {
        frame.delay_ms = GIF_DEFAULT_DELAY_MS;
    }
    frame.left = read_le16(desc);
    frame.top = read_le16(desc + 2);
    frame.width = read_le16(desc + 4);
    frame.height = read_le16(desc + 6);
    const std::uint8_t packed = desc[8];
    frame.local_color_table_flag = (packed & 0x80) != 0;
    frame.interlaced = (packed & 0x40) != 0;
    frame.sort_flag = (packed & 0x20) != 0;

    if (frame.local_color_table_flag) {
        frame.local_color_table_size = std::size_t{1} << ((packed & 0x07) + 1);
        auto table = read_color_table(reader_, frame.local_color_table_size);
        if (!table) {
            return table.error_info();
        }
        frame.local_color_table = std::move(table.value());
    }

    auto code_size = reader_.read_u8();
    if (!code_size) {
        return code_size.error_info();
    }
    frame.lzw_minimum_code_size = code_size.value();

    auto blocks = read_sub_blocks(reader_);
    if (!blocks) {
        return blocks.error_info();
    }
    std::vector<std::uint8_t> data;
    for (const auto& block : blocks.value()) {
        data.insert(data.end(), block.begin(), block.end());
    }
    frame.data_length = data.size();

    log_debug("GIF: frame " + std::to_string(info_.frames.size()) + " " +
              std::to_string(frame.width) + "x" + std::to_string(frame.height) + "+" +
              std::to_string(frame.left) + "+" + std::to_string(frame.top));

    info_.frames.push_back(std::move(frame));
    frame_data_.push_back(std::move(data));
    return {};
}

status gif_decoder::read_stream() {
    auto rewind = reader_.reset();
    if (!rewind) {
        return rewind;
    }
    info_ = gif_info{};
    frame_data_.clear();

    auto st = read_header();
    if (!st) {
        return st;
    }

    std::optional<gif_frame_info> control;
    for (;;) {
        auto block = reader_.read_u8();
        if (!block) {
            if (info_.frames.empty()) {
                return block.error_info();
            }
            log_warn("GIF: stream ended without trailer");
            return {};
        }

        status block_status;
        switch (block.value()) {
            case GIF_IMAGE_SEPARATOR:
                block_status = read_image_descriptor(std::exchange(control, std::nullopt));
                break;
            case GIF_EXTENSION_INTRODUCER:
                block_status = read_extension(control);
                break;
            case GIF_TRAILER:
                return {};
            default:
                if (info_.frames.empty()) {
                    return failure(decode_error::invalid_data,
                        "unexpected block introducer " + std::to_string(block.value()) +
                        " at offset " + std::to_string(reader_.position() - 1));
                }
                log_warn("GIF: unexpected block introducer " + std::to_string(block.value()) +
                         ", stopping");
                return {};
        }

        if (!block_status) {
            if (info_.frames.empty()) {
                return block_status;
            }
            log_warn("GIF: truncated after frame " + std::to_string(info_.frames.size()) + ": " +
                     block_status.message());
            return {};
        }
    }
}

result<std::vector<std::uint8_t>> gif_decoder::decode_frame(std::size_t index, std::uint32_t canvas_width,
                                                             std::uint32_t canvas_height) const {
    const gif_frame_info& frame = info_.frames[index];
    auto dims = validate_dimensions(frame.width, frame.height, options_);
    if (!dims) {
        return dims.error_info();
    }
    if (static_cast<std::uint32_t>(frame.left) + frame.width > canvas_width ||
        static_cast<std::uint32_t>(frame.top) + frame.height > canvas_height) {
        return failure(decode_error::invalid_data,
            "frame " + std::to_string(frame.width) + "x" + std::to_string(frame.height) + "+" +
            std::to_string(frame.left) + "+" + std::to_string(frame.top) + " exceeds the " +
            std::to_string(canvas_width) + "x" + std::to_string(canvas_height) + " canvas");
    }
    const std::size_t pixel_count = static_cast<std::size_t>(frame.width) * frame.height;

    auto indices = gif_detail::lzw_decode(frame_data_[index], frame.lzw_minimum_code_size, pixel_count);
    if (!indices) {
        return indices.error_info();
    }

    std::vector<std::uint8_t> pixels = std::move(indices.value());
    if (frame.interlaced) {
        pixels = gif_detail::deinterlace(pixels, frame.width, frame.height);
    }

    const std::vector<std::uint8_t>& table =
        frame.local_color_table_flag ? frame.local_color_table : info_.global_color_table;
    const std::size_t entries = table.size() / 3;

    std::vector<std::uint8_t> rgba(pixel_count * 4, 0);
    bool out_of_range = false;
    for (std::size_t i = 0; i < pixel_count; ++i) {
        const std::uint8_t idx = pixels[i];
        if (frame.transparent_index && idx == *frame.transparent_index) {
            continue;
        }
        std::uint8_t* dst = rgba.data() + i * 4;
        if (idx < entries) {
            dst[0] = table[idx * 3];
            dst[1] = table[idx * 3 + 1];
            dst[2] = table[idx * 3 + 2];
        } else {
            out_of_range = true;
        }
        dst[3] = 0xFF;
    }
    if (out_of_range) {
        log_warn("GIF: frame " + std::to_string(index) + " uses colors beyond its " +
                 std::to_string(entries) + "-entry color table, using black");
    }
    return rgba;
}

result<image> gif_decoder::decode() {
    auto st = read_stream();
    headers_parsed_ = true;
    if (!st) {
        return st.error_info();
    }
    if (info_.frames.empty()) {
        return failure(decode_error::invalid_data, "GIF contains no image");
    }

    std::uint32_t width = info_.canvas_width;
    std::uint32_t height = info_.canvas_height;
    if (width == 0 || height == 0) {
        const auto& first = info_.frames.front();
        width = static_cast<std::uint32_t>(first.left) + first.width;
        height = static_cast<std::uint32_t>(first.top) + first.height;
        log_warn("GIF: zero logical screen size, using " + std::to_string(width) + "x" +
                 std::to_string(height) + " from the first frame");
    }
    auto dims = validate_dimensions(width, height, options_);
    if (!dims) {
        return dims.error_info();
    }

    const std::size_t frame_limit = options_.decode_frames ? info_.frames.size() : 1;
    std::vector<image_frame> frames;
    for (std::size_t i = 0; i < frame_limit; ++i) {
        if (frames.size() >= options_.max_frames) {
            log_warn("GIF: frame limit " + std::to_string(options_.max_frames) + " reached");
            break;
        }
        const gif_frame_info& fi = info_.frames[i];
        if (fi.width == 0 || fi.height == 0) {
            log_warn("GIF: frame " + std::to_string(i) + " has zero size, skipped");
            continue;
        }

        auto rgba = decode_frame(i, width, height);
        if (!rgba) {
            if (i == 0) {
                return rgba.error_info();
            }
            log_warn("GIF: frame " + std::to_string(i) + ": " + rgba.message());
            continue;
        }

        image_frame frame;
        frame.left = fi.left;
        frame.top = fi.top;
        frame.width = fi.width;
        frame.height = fi.height;
        frame.delay_ms = fi.delay_ms;
        switch (fi.disposal) {
            case gif_disposal::background: frame.dispose = frame_dispose::background; break;
            case gif_disposal::previous:   frame.dispose = frame_dispose::previous; break;
            default:                       frame.dispose = frame_dispose::none; break;
        }
        frame.blend = frame_blend::over;
        frame.rgba = std::move(rgba.value());
        frames.push_back(std::move(frame));
    }

    if (frames.empty()) {
        return failure(decode_error::invalid_data, "GIF contains no decodable frame");
    }

    // First frame placed on a transparent canvas, clipped to the canvas
    std::vector<std::uint8_t> canvas(static_cast<std::size_t>(width) * height * 4, 0);
    const image_frame& first = frames.front();
    for (std::uint32_t y = 0; y < first.height; ++y) {
        const std::uint32_t cy = first.top + y;
        if (cy >= height) {
            break;
        }
        const std::uint32_t visible = first.left >= width ? 0 : std::min(first.width, width - first.left);
        if (visible == 0) {
            break;
        }
        std::memcpy(canvas.data() + (static_cast<std::size_t>(cy) * width + first.left) * 4,
                    first.rgba.data() + static_cast<std::size_t>(y) * first.width * 4,
                    static_cast<std::size_t>(visible) * 4);
    }

    auto img = image::from_pixels(width, height, pixel_format::rgba8, std::move(canvas));
    if (!img) {
        return img;
    }
    img.value().set_frames(std::move(frames));
    return img;
}

image_info gif_decoder::get_image_info() {
    if (!headers_parsed_) {
        headers_parsed_ = true;
        auto st = read_stream();
        if (!st) {
            log_warn("GIF: header parsing stopped: " + st.message());
        }
        auto rewind = reader_.reset();
        if (!rewind) {
            log_warn("GIF: " + rewind.message());
        }
    }
    return image_info{info_};
}

} // namespace vexel

#include <vexel/codecs/netpbm.hpp>
#include <vexel/info.hpp>
#include <vexel/log.hpp>
#include <vexel/safe_access.hpp>

#include "decode_helpers.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <string>
#include <vector>

namespace vexel {

const char* to_string(netpbm_variant variant) noexcept {
    switch (variant) {
        case netpbm_variant::pbm_ascii:  return "P1 (PBM, ASCII)";
        case netpbm_variant::pgm_ascii:  return "P2 (PGM, ASCII)";
        case netpbm_variant::ppm_ascii:  return "P3 (PPM, ASCII)";
        case netpbm_variant::pbm_binary: return "P4 (PBM, binary)";
        case netpbm_variant::pgm_binary: return "P5 (PGM, binary)";
        case netpbm_variant::ppm_binary: return "P6 (PPM, binary)";
        case netpbm_variant::pam:        return "P7 (PAM)";
    }
    return "unknown";
}

namespace {

bool is_space(std::uint8_t c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

class pnm_parser {
public:
    pnm_parser(std::span<const std::uint8_t> data, netpbm_info& info)
        : data_(data), info_(info), pos_(0) {}

    status parse_header() {
        if (data_.size() < 3 || data_[0] != 'P' || data_[1] < '1' || data_[1] > '7') {
            return failure(decode_error::invalid_format, "missing Netpbm magic number");
        }
        info_.variant = static_cast<netpbm_variant>(data_[1] - '0');
        pos_ = 2;

        if (info_.variant == netpbm_variant::pam) {
            return parse_pam_header();
        }

        // Parse width
        auto st = read_header_value(info_.width, "width");
        if (!st) return st;

        // Parse height
        st = read_header_value(info_.height, "height");
        if (!st) return st;

        const bool bitmap = info_.variant == netpbm_variant::pbm_ascii ||
                            info_.variant == netpbm_variant::pbm_binary;
        // Parse maxval (not present for PBM: P1, P4)
        if (!bitmap) {
            st = read_header_value(info_.max_value, "maxval");
            if (!st) return st;
        }
        info_.depth = (info_.variant == netpbm_variant::ppm_ascii ||
                       info_.variant == netpbm_variant::ppm_binary) ? 3 : 1;

        if (info_.binary()) {
            // Binary data could start with '#' byte which should not be treated as comment.
            // Exactly one whitespace byte separates the header from the raster.
            if (pos_ >= data_.size() || !is_space(data_[pos_])) {
                return failure(decode_error::invalid_data, "missing whitespace after Netpbm header");
            }
            pos_++;
        } else {
            skip_whitespace_and_comments();
        }

        info_.data_offset = pos_;
        return {};
    }

private:
    status read_header_value(std::uint32_t& value, const char* field) {
        skip_whitespace_and_comments();
        if (!parse_uint(value)) {
            return failure(decode_error::invalid_data,
                std::string("invalid Netpbm ") + field + " at offset " + std::to_string(pos_));
        }
        return {};
    }

    // PAM: KEYWORD value lines terminated by ENDHDR
    status parse_pam_header() {
        bool have_width = false;
        bool have_height = false;
        bool have_depth = false;
        bool have_maxval = false;

        for (;;) {
            skip_whitespace_and_comments();
            if (pos_ >= data_.size()) {
                return failure(decode_error::unexpected_eof, "PAM header ends without ENDHDR");
            }
            const std::string key = read_token();

            if (key == "ENDHDR") {
                // Rest of the line, including its newline, belongs to the header
                while (pos_ < data_.size() && data_[pos_] != '\n') {
                    pos_++;
                }
                if (pos_ < data_.size()) pos_++;
                break;
            }

            if (key == "TUPLTYPE") {
                std::string value = read_line();
                if (!info_.tuple_type.empty()) {
                    info_.tuple_type += ' ';
                }
                info_.tuple_type += value;
                continue;
            }

            std::uint32_t value = 0;
            skip_spaces_in_line();
            if (!parse_uint(value)) {
                return failure(decode_error::invalid_data, "invalid value for PAM " + key);
            }
            if (key == "WIDTH") {
                info_.width = value;
                have_width = true;
            } else if (key == "HEIGHT") {
                info_.height = value;
                have_height = true;
            } else if (key == "DEPTH") {
                info_.depth = value;
                have_depth = true;
            } else if (key == "MAXVAL") {
                info_.max_value = value;
                have_maxval = true;
            } else {
                log_warn("Netpbm: unknown PAM header field " + key + " ignored");
            }
        }

        if (!have_width || !have_height || !have_depth || !have_maxval) {
            return failure(decode_error::invalid_data,
                "PAM header lacks WIDTH, HEIGHT, DEPTH or MAXVAL");
        }
        info_.data_offset = pos_;
        return {};
    }

    void skip_whitespace_and_comments() {
        while (pos_ < data_.size()) {
            if (data_[pos_] == '#') {
                // Comment runs until end of line
                const std::size_t start = ++pos_;
                while (pos_ < data_.size() && data_[pos_] != '\n' && data_[pos_] != '\r') {
                    pos_++;
                }
                std::string comment(data_.begin() + static_cast<std::ptrdiff_t>(start),
                                    data_.begin() + static_cast<std::ptrdiff_t>(pos_));
                const auto first = comment.find_first_not_of(' ');
                info_.comments.push_back(first == std::string::npos ? std::string{} : comment.substr(first));
            } else if (is_space(data_[pos_])) {
                pos_++;
            } else {
                return;
            }
        }
    }

    void skip_spaces_in_line() {
        while (pos_ < data_.size() && (data_[pos_] == ' ' || data_[pos_] == '\t')) {
            pos_++;
        }
    }

    std::string read_token() {
        const std::size_t start = pos_;
        while (pos_ < data_.size() && !is_space(data_[pos_])) {
            pos_++;
        }
        return std::string(data_.begin() + static_cast<std::ptrdiff_t>(start),
                           data_.begin() + static_cast<std::ptrdiff_t>(pos_));
    }

    std::string read_line() {
        skip_spaces_in_line();
        const std::size_t start = pos_;
        while (pos_ < data_.size() && data_[pos_] != '\n') {
            pos_++;
        }
        std::string line(data_.begin() + static_cast<std::ptrdiff_t>(start),
                         data_.begin() + static_cast<std::ptrdiff_t>(pos_));
        while (!line.empty() && is_space(static_cast<std::uint8_t>(line.back()))) {
            line.pop_back();
        }
        return line;
    }

    bool parse_uint(std::uint32_t& value) {
        if (pos_ >= data_.size()) return false;

        const char* start = reinterpret_cast<const char*>(data_.data() + pos_);
        const char* end = reinterpret_cast<const char*>(data_.data() + data_.size());

        auto result = std::from_chars(start, end, value);
        if (result.ec != std::errc{}) return false;

        pos_ += static_cast<std::size_t>(result.ptr - start);
        return true;
    }

    std::span<const std::uint8_t> data_;
    netpbm_info& info_;
    std::size_t pos_;
};

status validate_header(const netpbm_info& info, const decode_options& options) {
    auto dims = validate_dimensions(info.width, info.height, options);
    if (!dims) {
        return dims;
    }
    if (info.max_value == 0 || info.max_value > 65535) {
        return failure(decode_error::invalid_data,
            "maxval " + std::to_string(info.max_value) + " outside 1..65535");
    }
    if (info.depth == 0 || info.depth > 4) {
        return failure(decode_error::unsupported_format,
            "PAM depth " + std::to_string(info.depth) + " not supported");
    }

    if (info.variant == netpbm_variant::pam && !info.tuple_type.empty()) {
        struct known_tuple { const char* name; std::uint32_t depth; };
        static constexpr known_tuple tuples[] = {
            {"BLACKANDWHITE", 1}, {"GRAYSCALE", 1}, {"RGB", 3},
            {"BLACKANDWHITE_ALPHA", 2}, {"GRAYSCALE_ALPHA", 2}, {"RGB_ALPHA", 4},
        };
        const auto* it = std::find_if(std::begin(tuples), std::end(tuples),
            [&](const known_tuple& t) { return info.tuple_type == t.name; });
        if (it == std::end(tuples)) {
            log_warn("Netpbm: unknown tuple type " + info.tuple_type + ", decoding by depth");
        } else if (it->depth != info.depth) {
            log_warn("Netpbm: tuple type " + info.tuple_type + " expects depth " +
                     std::to_string(it->depth) + ", header says " + std::to_string(info.depth));
        }
    }
    return {};
}

// Read ASCII PBM (P1); digits need not be separated
status read_pbm_ascii(std::span<const std::uint8_t> data, std::size_t pos,
                      std::vector<std::uint16_t>& samples) {
    for (auto& sample : samples) {
        while (pos < data.size() && (is_space(data[pos]) || data[pos] == '#')) {
            if (data[pos] == '#') {
                while (pos < data.size() && data[pos] != '\n') pos++;
            } else {
                pos++;
            }
        }
        if (pos >= data.size()) {
            return failure(decode_error::unexpected_eof, "PBM raster ends early");
        }
        if (data[pos] != '0' && data[pos] != '1') {
            return failure(decode_error::invalid_data,
                "invalid PBM digit at offset " + std::to_string(pos));
        }
        sample = data[pos] == '1' ? 1 : 0;
        pos++;
    }
    return {};
}

// Read binary PBM (P4); rows are padded to whole bytes
status read_pbm_binary(std::span<const std::uint8_t> data, std::size_t pos,
                       std::uint32_t width, std::uint32_t height,
                       std::vector<std::uint16_t>& samples) {
    const std::size_t row_bytes = (static_cast<std::size_t>(width) + 7) / 8;
    for (std::uint32_t y = 0; y < height; y++) {
        auto row = get_range_safe(data, pos, pos + row_bytes);
        if (!row) {
            return failure(decode_error::unexpected_eof,
                "PBM raster ends at row " + std::to_string(y) + ": " + row.message());
        }
        for (std::uint32_t x = 0; x < width; x++) {
            samples[static_cast<std::size_t>(y) * width + x] = extract_pixel(row.value().data(), x, 1);
        }
        pos += row_bytes;
    }
    return {};
}

// Read ASCII PGM/PPM (P2, P3)
status read_ascii(std::span<const std::uint8_t> data, std::size_t pos,
                  std::vector<std::uint16_t>& samples) {
    const char* ptr = reinterpret_cast<const char*>(data.data()) + pos;
    const char* end = reinterpret_cast<const char*>(data.data()) + data.size();

    for (auto& sample : samples) {
        // Skip whitespace
        while (ptr < end && std::isspace(static_cast<unsigned char>(*ptr))) ptr++;
        if (ptr >= end) {
            return failure(decode_error::unexpected_eof, "ASCII raster ends early");
        }

        std::uint32_t val = 0;
        auto result = std::from_chars(ptr, end, val);
        if (result.ec != std::errc{}) {
            return failure(decode_error::invalid_data,
                "invalid ASCII sample at offset " +
                std::to_string(ptr - reinterpret_cast<const char*>(data.data())));
        }
        ptr = result.ptr;
        sample = static_cast<std::uint16_t>(std::min<std::uint32_t>(val, 65535));
    }
    return {};
}

// Read binary PGM/PPM/PAM (P5, P6, P7); 16-bit samples are big-endian
status read_binary(std::span<const std::uint8_t> data, std::size_t pos, bool wide,
                   std::vector<std::uint16_t>& samples) {
    const std::size_t bytes = samples.size() * (wide ? 2 : 1);
    auto raster = get_range_safe(data, pos, pos + bytes);
    if (!raster) {
        return failure(decode_error::unexpected_eof, "binary raster truncated: " + raster.message());
    }
    const std::uint8_t* p = raster.value().data();
    for (std::size_t i = 0; i < samples.size(); i++) {
        samples[i] = wide ? static_cast<std::uint16_t>((p[i * 2] << 8) | p[i * 2 + 1]) : p[i];
    }
    return {};
}

pixel_format format_for(std::uint32_t depth, bool wide) {
    switch (depth) {
        case 1:  return wide ? pixel_format::l16 : pixel_format::l8;
        case 2:  return wide ? pixel_format::la16 : pixel_format::la8;
        case 3:  return wide ? pixel_format::rgb16 : pixel_format::rgb8;
        default: return wide ? pixel_format::rgba16 : pixel_format::rgba8;
    }
}

} // namespace

// ============================================================================
// Netpbm Decoder
// ============================================================================

bool netpbm_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < 3) return false;
    if (data[0] != 'P') return false;
    if (data[1] < '1' || data[1] > '7') return false;
    // Third character must be whitespace
    return is_space(data[2]);
}

netpbm_decoder::netpbm_decoder(std::unique_ptr<byte_source> source, const decode_options& options)
    : reader_(std::move(source)), options_(options) {}

status netpbm_decoder::read_file() {
    auto rewind = reader_.reset();
    if (!rewind) {
        return rewind;
    }
    auto bytes = reader_.read_to_end();
    if (!bytes) {
        return bytes.error_info();
    }
    data_ = std::move(bytes.value());
    info_ = netpbm_info{};

    pnm_parser parser(data_, info_);
    return parser.parse_header();
}

result<image> netpbm_decoder::decode() {
    auto st = read_file();
    headers_parsed_ = true;
    if (!st) {
        return st.error_info();
    }
    auto valid = validate_header(info_, options_);
    if (!valid) {
        return valid.error_info();
    }

    const std::size_t count = static_cast<std::size_t>(info_.width) * info_.height * info_.depth;
    std::vector<std::uint16_t> samples(count, 0);
    const bool wide = info_.max_value > 255;

    status raster;
    switch (info_.variant) {
        case netpbm_variant::pbm_ascii:
            raster = read_pbm_ascii(data_, info_.data_offset, samples);
            break;
        case netpbm_variant::pbm_binary:
            raster = read_pbm_binary(data_, info_.data_offset, info_.width, info_.height, samples);
            break;
        case netpbm_variant::pgm_ascii:
        case netpbm_variant::ppm_ascii:
            raster = read_ascii(data_, info_.data_offset, samples);
            break;
        case netpbm_variant::pgm_binary:
        case netpbm_variant::ppm_binary:
        case netpbm_variant::pam:
            raster = read_binary(data_, info_.data_offset, wide, samples);
            break;
    }
    if (!raster) {
        return raster.error_info();
    }

    // PBM: 1 = black, 0 = white
    if (info_.variant == netpbm_variant::pbm_ascii || info_.variant == netpbm_variant::pbm_binary) {
        std::vector<std::uint8_t> gray(count);
        std::transform(samples.begin(), samples.end(), gray.begin(),
                       [](std::uint16_t v) { return static_cast<std::uint8_t>(v ? 0 : 255); });
        return image::from_pixels(info_.width, info_.height, pixel_format::l8, std::move(gray));
    }

    bool clipped = false;
    for (auto& v : samples) {
        if (v > info_.max_value) {
            v = static_cast<std::uint16_t>(info_.max_value);
            clipped = true;
        }
    }
    if (clipped) {
        log_warn("Netpbm: samples above maxval " + std::to_string(info_.max_value) + " clamped");
    }

    const pixel_format fmt = format_for(info_.depth, wide);
    if (wide) {
        std::vector<std::uint16_t> out(count);
        std::transform(samples.begin(), samples.end(), out.begin(),
                       [&](std::uint16_t v) { return scale_to_16(v, info_.max_value); });
        return image::from_pixels16(info_.width, info_.height, fmt, std::move(out));
    }

    std::vector<std::uint8_t> out(count);
    std::transform(samples.begin(), samples.end(), out.begin(),
                   [&](std::uint16_t v) { return scale_to_8(v, info_.max_value); });
    return image::from_pixels(info_.width, info_.height, fmt, std::move(out));
}

image_info netpbm_decoder::get_image_info() {
    if (!headers_parsed_) {
        headers_parsed_ = true;
        auto st = read_file();
        if (!st) {
            log_warn("Netpbm: header parsing stopped: " + st.message());
        }
        auto rewind = reader_.reset();
        if (!rewind) {
            log_warn("Netpbm: " + rewind.message());
        }
    }
    return image_info{info_};
}

} // namespace vexel

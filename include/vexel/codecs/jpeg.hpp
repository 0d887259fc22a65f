#ifndef VEXEL_CODECS_JPEG_HPP_
#define VEXEL_CODECS_JPEG_HPP_

#include <vexel/vexel_export.h>
#include <vexel/bit_reader.hpp>
#include <vexel/decoder.hpp>
#include <vexel/marker.hpp>
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
// JPEG Markers
// ============================================================================

enum class jpeg_marker : std::uint16_t {
    sof0 = 0xFFC0, sof1 = 0xFFC1, sof2 = 0xFFC2, sof3 = 0xFFC3,
    dht = 0xFFC4,
    sof5 = 0xFFC5, sof6 = 0xFFC6, sof7 = 0xFFC7,
    jpg = 0xFFC8,
    sof9 = 0xFFC9, sof10 = 0xFFCA, sof11 = 0xFFCB,
    dac = 0xFFCC,
    sof13 = 0xFFCD, sof14 = 0xFFCE, sof15 = 0xFFCF,
    rst0 = 0xFFD0, rst1 = 0xFFD1, rst2 = 0xFFD2, rst3 = 0xFFD3,
    rst4 = 0xFFD4, rst5 = 0xFFD5, rst6 = 0xFFD6, rst7 = 0xFFD7,
    soi = 0xFFD8,
    eoi = 0xFFD9,
    sos = 0xFFDA,
    dqt = 0xFFDB,
    dnl = 0xFFDC,
    dri = 0xFFDD,
    dhp = 0xFFDE,
    exp = 0xFFDF,
    app0 = 0xFFE0, app1 = 0xFFE1, app2 = 0xFFE2, app3 = 0xFFE3,
    app4 = 0xFFE4, app5 = 0xFFE5, app6 = 0xFFE6, app7 = 0xFFE7,
    app8 = 0xFFE8, app9 = 0xFFE9, app10 = 0xFFEA, app11 = 0xFFEB,
    app12 = 0xFFEC, app13 = 0xFFED, app14 = 0xFFEE, app15 = 0xFFEF,
    jpg0 = 0xFFF0, jpg1 = 0xFFF1, jpg2 = 0xFFF2, jpg3 = 0xFFF3,
    jpg4 = 0xFFF4, jpg5 = 0xFFF5, jpg6 = 0xFFF6, jpg7 = 0xFFF7,
    jpg8 = 0xFFF8, jpg9 = 0xFFF9, jpg10 = 0xFFFA, jpg11 = 0xFFFB,
    jpg12 = 0xFFFC, jpg13 = 0xFFFD,
    com = 0xFFFE,
    tem = 0xFF01
};

template <>
struct marker_traits<jpeg_marker> {
    /// TEM, SOFn, DHT, DAC, RSTn, SOI..EXP, APPn, JPGn, COM. Reserved
    /// RES codes (0xFF02..0xFFBF) are not segment markers.
    [[nodiscard]] static std::optional<jpeg_marker> from_u16(std::uint16_t value) noexcept {
        if (value == 0xFF01 || (value >= 0xFFC0 && value <= 0xFFFE)) {
            return static_cast<jpeg_marker>(value);
        }
        return std::nullopt;
    }

    [[nodiscard]] static std::uint16_t to_u16(jpeg_marker m) noexcept {
        return static_cast<std::uint16_t>(m);
    }
};

/**
 * Every marker the segment scanner stops at.
 */
[[nodiscard]] VEXEL_EXPORT std::span<const jpeg_marker> jpeg_known_markers() noexcept;

[[nodiscard]] VEXEL_EXPORT const char* to_string(jpeg_marker m) noexcept;

// ============================================================================
// JPEG Metadata
// ============================================================================

enum class jpeg_mode {
    baseline,
    extended_sequential,
    progressive,
    lossless
};

enum class jpeg_coding {
    huffman,
    arithmetic
};

[[nodiscard]] VEXEL_EXPORT const char* to_string(jpeg_mode mode) noexcept;
[[nodiscard]] VEXEL_EXPORT const char* to_string(jpeg_coding coding) noexcept;

/// Zig-zag index -> natural (row-major) index.
inline constexpr std::array<std::uint8_t, 64> jpeg_zigzag = {
     0,  1,  8, 16,  9,  2,  3, 10,
    17, 24, 32, 25, 18, 11,  4,  5,
    12, 19, 26, 33, 40, 48, 41, 34,
    27, 20, 13,  6,  7, 14, 21, 28,
    35, 42, 49, 56, 57, 50, 43, 36,
    29, 22, 15, 23, 30, 37, 44, 51,
    58, 59, 52, 45, 38, 31, 39, 46,
    53, 60, 61, 54, 47, 55, 62, 63
};

struct jpeg_quantization_table {
    std::uint8_t id = 0;
    std::uint8_t precision = 0;  // 0 = 8-bit entries, 1 = 16-bit entries
    std::array<std::uint16_t, 64> values{};  // natural order
};

struct jpeg_huffman_table {
    std::uint8_t id = 0;
    std::uint8_t table_class = 0;  // 0 = DC, 1 = AC
    std::array<std::uint8_t, 16> counts{};
    std::vector<std::uint8_t> symbols;
    std::vector<std::uint16_t> codes;  // canonical code per symbol
};

/// DAC conditioning entry: DC tables carry (L, U), AC tables carry Kx.
struct jpeg_arithmetic_table {
    std::uint8_t id = 0;
    std::uint8_t table_class = 0;
    std::uint8_t value = 0;
};

struct jpeg_component {
    std::uint8_t id = 0;
    std::uint8_t h_sampling = 1;
    std::uint8_t v_sampling = 1;
    std::uint8_t quant_table_id = 0;
};

struct jfif_header {
    std::string identifier;
    std::uint8_t version_major = 0;
    std::uint8_t version_minor = 0;
    std::uint8_t density_units = 0;
    std::uint16_t x_density = 0;
    std::uint16_t y_density = 0;
    std::uint8_t thumbnail_width = 0;
    std::uint8_t thumbnail_height = 0;
    std::vector<std::uint8_t> thumbnail;  // packed RGB
};

struct exif_ifd_entry {
    std::uint16_t tag = 0;
    std::uint16_t format = 0;
    std::uint32_t components = 0;
    std::uint32_t value_offset = 0;
};

struct exif_header {
    std::string identifier;
    bool big_endian = false;
    std::uint32_t first_ifd_offset = 0;
    std::vector<exif_ifd_entry> entries;
};

struct jpeg_scan_component {
    std::uint8_t component_id = 0;
    std::uint8_t dc_table = 0;
    std::uint8_t ac_table = 0;
};

struct jpeg_scan_info {
    std::vector<jpeg_scan_component> components;
    std::uint8_t spectral_start = 0;     // Ss (predictor for lossless)
    std::uint8_t spectral_end = 63;      // Se
    std::uint8_t approx_high = 0;        // Ah
    std::uint8_t approx_low = 0;         // Al (point transform for lossless)
    std::size_t data_length = 0;         // entropy-coded bytes after unstuffing
    std::size_t segments = 0;            // entropy-coded segments (restart markers + 1)
};

struct jpeg_info {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint8_t precision = 0;
    jpeg_mode mode = jpeg_mode::baseline;
    jpeg_coding coding = jpeg_coding::huffman;
    std::optional<jpeg_marker> frame_marker;
    std::vector<jpeg_component> components;
    std::vector<jpeg_quantization_table> quantization_tables;
    std::vector<jpeg_huffman_table> huffman_tables;
    std::vector<jpeg_arithmetic_table> arithmetic_tables;
    std::vector<jpeg_scan_info> scans;
    std::uint16_t restart_interval = 0;
    std::optional<jfif_header> jfif;
    std::optional<exif_header> exif;
    std::optional<std::uint8_t> adobe_transform;
    std::vector<std::string> comments;
};

// ============================================================================
// JPEG Decoder
// ============================================================================

class VEXEL_EXPORT jpeg_decoder : public image_decoder {
public:
    static constexpr std::string_view name = "jpeg";
    static constexpr std::string_view extensions[] = {".jpg", ".jpeg", ".jpe", ".jfif"};

    /**
     * Check if data starts with the SOI marker.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    explicit jpeg_decoder(std::unique_ptr<byte_source> source, const decode_options& options = {});
    ~jpeg_decoder() override;

    [[nodiscard]] image_format format() const noexcept override { return image_format::jpeg; }

    /**
     * Decode a JPEG stream.
     * Supports:
     *   - SOF0/SOF1: baseline and extended sequential, Huffman
     *   - SOF2: progressive, Huffman
     *   - SOF3: lossless, Huffman
     *   - SOF9/SOF10: sequential and progressive, arithmetic
     *   - 8-bit (RGB8/L8) and 12-bit (RGB16/L16) precision
     *   - grayscale, YCbCr and CMYK/YCCK components with any sampling factors
     *
     * Decoding stops at EOI or stream exhaustion; truncated entropy data
     * leaves the remaining blocks zero.
     */
    [[nodiscard]] result<image> decode() override;

    [[nodiscard]] image_info get_image_info() override;

    [[nodiscard]] const jpeg_info& info() const noexcept { return info_; }

private:
    struct frame_state;

    [[nodiscard]] status parse_headers_only();
    [[nodiscard]] status process_segment(jpeg_marker marker, bool decode_scans);
    [[nodiscard]] status process_scan(std::vector<std::uint8_t> header, bool decode_scans);

    bit_reader reader_;
    decode_options options_;
    jpeg_info info_;
    std::unique_ptr<frame_state> frame_;
    bool headers_parsed_ = false;
    bool decoded_ = false;
};

} // namespace vexel

#endif // VEXEL_CODECS_JPEG_HPP_

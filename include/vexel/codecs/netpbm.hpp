#ifndef VEXEL_CODECS_NETPBM_HPP_
#define VEXEL_CODECS_NETPBM_HPP_

#include <vexel/vexel_export.h>
#include <vexel/bit_reader.hpp>
#include <vexel/decoder.hpp>
#include <vexel/types.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vexel {

// ============================================================================
// Netpbm Metadata
// ============================================================================

enum class netpbm_variant : std::uint8_t {
    pbm_ascii = 1,   // P1
    pgm_ascii = 2,   // P2
    ppm_ascii = 3,   // P3
    pbm_binary = 4,  // P4
    pgm_binary = 5,  // P5
    ppm_binary = 6,  // P6
    pam = 7          // P7
};

[[nodiscard]] VEXEL_EXPORT const char* to_string(netpbm_variant variant) noexcept;

struct netpbm_info {
    netpbm_variant variant = netpbm_variant::pbm_ascii;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t max_value = 1;  // 1 for PBM
    std::uint32_t depth = 1;      // channels per pixel
    std::string tuple_type;       // P7 TUPLTYPE, empty otherwise
    std::vector<std::string> comments;
    std::size_t data_offset = 0;

    [[nodiscard]] bool binary() const noexcept {
        return variant >= netpbm_variant::pbm_binary;
    }
};

// ============================================================================
// Netpbm Decoder
// ============================================================================

class VEXEL_EXPORT netpbm_decoder : public image_decoder {
public:
    static constexpr std::string_view name = "netpbm";
    static constexpr std::string_view extensions[] = {".pbm", ".pgm", ".ppm", ".pnm", ".pam"};

    /**
     * Check for "P1".."P7" followed by whitespace.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    explicit netpbm_decoder(std::unique_ptr<byte_source> source, const decode_options& options = {});

    [[nodiscard]] image_format format() const noexcept override { return image_format::netpbm; }

    /**
     * Decode PBM/PGM/PPM (ASCII and binary) and PAM images.
     * Bitmaps decode to l8; maxval up to 255 gives 8-bit output, larger
     * maxval 16-bit output. Samples are rescaled to the full range.
     */
    [[nodiscard]] result<image> decode() override;

    [[nodiscard]] image_info get_image_info() override;

    [[nodiscard]] const netpbm_info& info() const noexcept { return info_; }

private:
    [[nodiscard]] status read_file();

    bit_reader reader_;
    decode_options options_;
    netpbm_info info_;
    std::vector<std::uint8_t> data_;
    bool headers_parsed_ = false;
};

} // namespace vexel

#endif // VEXEL_CODECS_NETPBM_HPP_
